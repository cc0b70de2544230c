#include <lanebridge/reward/currency.hpp>
#include <lanebridge/schema/key/fee_market_keys.hpp>
#include <lanebridge/schema/order.hpp>

#include <spdlog/spdlog.h>

namespace lanebridge::reward {

storage_currency::storage_currency(
    lanebridge::schema::encoding::scale_encoder_t& encoder,
    lanebridge::storage::rocksdb_storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

lanebridge::schema::account_balance_t storage_currency::record(
    const lanebridge::schema::account_id_t& account) const {
  return storage_
      .get<lanebridge::schema::account_balance_t>(
          encoder_, lanebridge::schema::key::make_balance_key(account))
      .value_or(lanebridge::schema::account_balance_t{});
}

void storage_currency::store(
    const lanebridge::schema::account_id_t& account,
    const lanebridge::schema::account_balance_t& value) {
  storage_.put(encoder_, lanebridge::schema::key::make_balance_key(account),
               value);
}

lanebridge::schema::amount_t storage_currency::balance(
    const lanebridge::schema::account_id_t& account) const {
  return record(account).free;
}

lanebridge::schema::amount_t storage_currency::locked(
    const lanebridge::schema::account_id_t& account) const {
  return record(account).locked;
}

void storage_currency::set_lock(const lanebridge::schema::account_id_t& account,
                                const lanebridge::schema::amount_t& amount) {
  auto value = record(account);
  if (value.locked == amount) {
    return;
  }
  value.locked = amount;
  store(account, value);
}

bool storage_currency::transfer(const lanebridge::schema::account_id_t& from,
                                const lanebridge::schema::account_id_t& to,
                                const lanebridge::schema::amount_t& amount) {
  if (amount == 0 || from == to) {
    return true;
  }
  auto source = record(from);
  const auto spendable =
      source.free - std::min(source.free, source.locked);
  if (spendable < amount) {
    spdlog::debug("Transfer of {} refused, spendable {} of {}", amount.str(),
                  spendable.str(), source.free.str());
    return false;
  }
  source.free -= amount;
  store(from, source);
  auto target = record(to);
  target.free += amount;
  store(to, target);
  return true;
}

void storage_currency::deposit(const lanebridge::schema::account_id_t& account,
                               const lanebridge::schema::amount_t& amount) {
  auto value = record(account);
  value.free += amount;
  store(account, value);
}

}  // namespace lanebridge::reward
