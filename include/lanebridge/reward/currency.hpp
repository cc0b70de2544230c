#pragma once

#include <lanebridge/schema/encoding/scale/encoder.hpp>
#include <lanebridge/schema/primitives.hpp>
#include <lanebridge/storage/rocksdb/storage.hpp>

#include <algorithm>

namespace lanebridge::reward {

/// Balance transfers used for fees, rewards and slashes, plus the lock that
/// holds relayer collateral in place.
class currency {
 public:
  virtual ~currency() = default;

  /// Move `amount` from `from` to `to`. Only the unlocked part of `from` can
  /// move. False leaves both balances unchanged.
  virtual bool transfer(const lanebridge::schema::account_id_t& from,
                        const lanebridge::schema::account_id_t& to,
                        const lanebridge::schema::amount_t& amount) = 0;

  /// Total balance, locked part included.
  virtual lanebridge::schema::amount_t balance(
      const lanebridge::schema::account_id_t& account) const = 0;

  virtual lanebridge::schema::amount_t locked(
      const lanebridge::schema::account_id_t& account) const = 0;

  /// Replace the lock on `account`. Zero releases it.
  virtual void set_lock(const lanebridge::schema::account_id_t& account,
                        const lanebridge::schema::amount_t& amount) = 0;

  void remove_lock(const lanebridge::schema::account_id_t& account) {
    set_lock(account, 0);
  }

  /// Part of the balance a transfer may move.
  lanebridge::schema::amount_t free_balance(
      const lanebridge::schema::account_id_t& account) const {
    const auto total = balance(account);
    return total - std::min(total, locked(account));
  }
};

/// Balances kept in the store under SYS|FEE|BALANCE| keys.
class storage_currency final : public currency {
 public:
  storage_currency(lanebridge::schema::encoding::scale_encoder_t& encoder,
                   lanebridge::storage::rocksdb_storage_t& storage);

  bool transfer(const lanebridge::schema::account_id_t& from,
                const lanebridge::schema::account_id_t& to,
                const lanebridge::schema::amount_t& amount) override;

  lanebridge::schema::amount_t balance(
      const lanebridge::schema::account_id_t& account) const override;

  lanebridge::schema::amount_t locked(
      const lanebridge::schema::account_id_t& account) const override;

  void set_lock(const lanebridge::schema::account_id_t& account,
                const lanebridge::schema::amount_t& amount) override;

  /// Credit `amount` out of thin air (genesis funding, tests).
  void deposit(const lanebridge::schema::account_id_t& account,
               const lanebridge::schema::amount_t& amount);

 private:
  lanebridge::schema::account_balance_t record(
      const lanebridge::schema::account_id_t& account) const;

  void store(const lanebridge::schema::account_id_t& account,
             const lanebridge::schema::account_balance_t& value);

  lanebridge::schema::encoding::scale_encoder_t& encoder_;
  lanebridge::storage::rocksdb_storage_t& storage_;
};

}  // namespace lanebridge::reward
