#pragma once

#include <lanebridge/reward/currency.hpp>
#include <lanebridge/reward/order_book.hpp>
#include <lanebridge/schema/bridge_error_code.hpp>
#include <lanebridge/schema/encoding/scale/encoder.hpp>
#include <lanebridge/schema/order.hpp>
#include <lanebridge/schema/primitives.hpp>
#include <lanebridge/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace lanebridge::reward {

/// Relayers that offered to deliver messages, with the collateral they lock
/// and the fee they quote. The collateral is held by a currency lock for as
/// long as the relayer stays enrolled.
class relayer_registry final {
 public:
  relayer_registry(lanebridge::schema::encoding::scale_encoder_t& encoder,
                   lanebridge::storage::rocksdb_storage_t& storage,
                   currency& currency,
                   const order_book& orders);

  /// Collateral must be non-zero and covered by the relayer's free balance.
  lanebridge::schema::bridge_error_code_t enroll(
      const lanebridge::schema::account_id_t& id,
      const lanebridge::schema::amount_t& collateral,
      const lanebridge::schema::amount_t& fee);

  /// The new collateral may not drop below what the relayer's open orders
  /// committed (`relayer_occupied`).
  lanebridge::schema::bridge_error_code_t update_collateral(
      const lanebridge::schema::account_id_t& id,
      const lanebridge::schema::amount_t& collateral);

  lanebridge::schema::bridge_error_code_t update_fee(
      const lanebridge::schema::account_id_t& id,
      const lanebridge::schema::amount_t& fee);

  /// Refused with `relayer_occupied` while any order still assigns the
  /// relayer a slot.
  lanebridge::schema::bridge_error_code_t cancel(
      const lanebridge::schema::account_id_t& id);

  std::optional<lanebridge::schema::relayer_t> relayer(
      const lanebridge::schema::account_id_t& id) const;

  /// Collateral currently locked by `id`; zero for unknown relayers.
  lanebridge::schema::amount_t locked_collateral(
      const lanebridge::schema::account_id_t& id) const;

  /// Record collateral left after a slash and lock exactly that much.
  void set_locked_collateral(const lanebridge::schema::account_id_t& id,
                             const lanebridge::schema::amount_t& collateral);

  std::vector<lanebridge::schema::relayer_t> relayers() const;

  /// The `count` cheapest relayers able to lock `collateral_per_order`,
  /// ordered by quote then enrollment. Empty when fewer are available.
  std::optional<std::vector<lanebridge::schema::relayer_t>> assigned_relayers(
      std::size_t count,
      const lanebridge::schema::amount_t& collateral_per_order) const;

  /// Collateral committed to the relayer's unsettled orders.
  lanebridge::schema::amount_t occupied_collateral(
      const lanebridge::schema::account_id_t& id) const;

  /// Quote of the last assigned relayer: the minimum fee a message must pay.
  std::optional<lanebridge::schema::amount_t> market_fee(
      std::size_t count,
      const lanebridge::schema::amount_t& collateral_per_order) const;

 private:
  uint64_t next_sequence();

  lanebridge::schema::encoding::scale_encoder_t& encoder_;
  lanebridge::storage::rocksdb_storage_t& storage_;
  currency& currency_;
  const order_book& orders_;
};

}  // namespace lanebridge::reward
