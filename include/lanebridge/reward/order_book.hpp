#pragma once

#include <lanebridge/schema/encoding/scale/encoder.hpp>
#include <lanebridge/schema/lane_data.hpp>
#include <lanebridge/schema/order.hpp>
#include <lanebridge/schema/primitives.hpp>
#include <lanebridge/storage/rocksdb/storage.hpp>

#include <optional>
#include <vector>

namespace lanebridge::reward {

/// Orders of messages that were accepted but not yet paid out.
class order_book final {
 public:
  order_book(lanebridge::schema::encoding::scale_encoder_t& encoder,
             lanebridge::storage::rocksdb_storage_t& storage);

  /// Slot i of the order is [sent_time + i * slot_length,
  /// sent_time + (i + 1) * slot_length).
  lanebridge::schema::order_t create_order(
      const lanebridge::schema::lane_id_t& lane,
      lanebridge::schema::message_nonce_t nonce,
      const lanebridge::schema::amount_t& fee,
      lanebridge::schema::block_number_t sent_time,
      const std::vector<lanebridge::schema::relayer_t>& assigned,
      lanebridge::schema::block_number_t slot_length,
      const lanebridge::schema::amount_t& collateral_per_order);

  std::optional<lanebridge::schema::order_t> order(
      const lanebridge::schema::lane_id_t& lane,
      lanebridge::schema::message_nonce_t nonce) const;

  /// Stamp `confirm_time` on every order of the range that has one.
  void confirm(const lanebridge::schema::lane_id_t& lane,
               const lanebridge::schema::delivered_messages_t& range,
               lanebridge::schema::block_number_t confirm_time);

  /// Remove a paid-out order.
  void settle(const lanebridge::schema::lane_id_t& lane,
              lanebridge::schema::message_nonce_t nonce);

  /// Unsettled orders that assign a slot to `relayer`, on any lane.
  std::vector<lanebridge::schema::order_t> open_orders(
      const lanebridge::schema::account_id_t& relayer) const;

  /// True once no order is left for the message.
  bool is_settled(const lanebridge::schema::lane_id_t& lane,
                  lanebridge::schema::message_nonce_t nonce) const;

 private:
  lanebridge::schema::encoding::scale_encoder_t& encoder_;
  lanebridge::storage::rocksdb_storage_t& storage_;
};

}  // namespace lanebridge::reward
