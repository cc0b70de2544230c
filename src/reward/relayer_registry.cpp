#include <lanebridge/reward/relayer_registry.hpp>
#include <lanebridge/schema/key/fee_market_keys.hpp>

#include <algorithm>
#include <spdlog/spdlog.h>

namespace lanebridge::reward {

relayer_registry::relayer_registry(
    lanebridge::schema::encoding::scale_encoder_t& encoder,
    lanebridge::storage::rocksdb_storage_t& storage,
    currency& currency,
    const order_book& orders)
    : encoder_{encoder},
      storage_{storage},
      currency_{currency},
      orders_{orders} {}

uint64_t relayer_registry::next_sequence() {
  const auto key = lanebridge::schema::key::make_relayer_sequence_key();
  const auto sequence = storage_.get<uint64_t>(encoder_, key).value_or(0);
  storage_.put(encoder_, key, sequence + 1);
  return sequence;
}

lanebridge::schema::bridge_error_code_t relayer_registry::enroll(
    const lanebridge::schema::account_id_t& id,
    const lanebridge::schema::amount_t& collateral,
    const lanebridge::schema::amount_t& fee) {
  if (relayer(id)) {
    return lanebridge::schema::bridge_error_code_t::relayer_already_enrolled;
  }
  if (collateral.is_zero()) {
    return lanebridge::schema::bridge_error_code_t::insufficient_collateral;
  }
  if (currency_.free_balance(id) < collateral) {
    return lanebridge::schema::bridge_error_code_t::insufficient_balance;
  }
  auto record = lanebridge::schema::relayer_t{};
  record.id = id;
  record.collateral = collateral;
  record.fee = fee;
  record.enrolled_at = next_sequence();
  storage_.put(encoder_, lanebridge::schema::key::make_relayer_key(id), record);
  currency_.set_lock(id, collateral);
  spdlog::info("Relayer {} enrolled, collateral {}, fee {}",
               lanebridge::schema::to_hex(id), collateral.str(), fee.str());
  return lanebridge::schema::bridge_error_code_t::ok;
}

lanebridge::schema::bridge_error_code_t relayer_registry::update_collateral(
    const lanebridge::schema::account_id_t& id,
    const lanebridge::schema::amount_t& collateral) {
  auto record = relayer(id);
  if (!record) {
    return lanebridge::schema::bridge_error_code_t::relayer_not_enrolled;
  }
  if (collateral.is_zero()) {
    return lanebridge::schema::bridge_error_code_t::insufficient_collateral;
  }
  // The current lock is replaced, so the whole balance backs the new amount.
  if (currency_.balance(id) < collateral) {
    return lanebridge::schema::bridge_error_code_t::insufficient_balance;
  }
  if (const auto occupied = occupied_collateral(id); collateral < occupied) {
    spdlog::warn("Relayer {} keeps {} committed to open orders",
                 lanebridge::schema::to_hex(id), occupied.str());
    return lanebridge::schema::bridge_error_code_t::relayer_occupied;
  }
  record->collateral = collateral;
  storage_.put(encoder_, lanebridge::schema::key::make_relayer_key(id), *record);
  currency_.set_lock(id, collateral);
  return lanebridge::schema::bridge_error_code_t::ok;
}

lanebridge::schema::bridge_error_code_t relayer_registry::update_fee(
    const lanebridge::schema::account_id_t& id,
    const lanebridge::schema::amount_t& fee) {
  auto record = relayer(id);
  if (!record) {
    return lanebridge::schema::bridge_error_code_t::relayer_not_enrolled;
  }
  record->fee = fee;
  storage_.put(encoder_, lanebridge::schema::key::make_relayer_key(id), *record);
  return lanebridge::schema::bridge_error_code_t::ok;
}

lanebridge::schema::bridge_error_code_t relayer_registry::cancel(
    const lanebridge::schema::account_id_t& id) {
  if (!relayer(id)) {
    return lanebridge::schema::bridge_error_code_t::relayer_not_enrolled;
  }
  if (!orders_.open_orders(id).empty()) {
    return lanebridge::schema::bridge_error_code_t::relayer_occupied;
  }
  storage_.erase(lanebridge::schema::key::make_relayer_key(id));
  currency_.remove_lock(id);
  spdlog::info("Relayer {} cancelled enrollment",
               lanebridge::schema::to_hex(id));
  return lanebridge::schema::bridge_error_code_t::ok;
}

std::optional<lanebridge::schema::relayer_t> relayer_registry::relayer(
    const lanebridge::schema::account_id_t& id) const {
  return storage_.get<lanebridge::schema::relayer_t>(
      encoder_, lanebridge::schema::key::make_relayer_key(id));
}

lanebridge::schema::amount_t relayer_registry::locked_collateral(
    const lanebridge::schema::account_id_t& id) const {
  auto record = relayer(id);
  if (!record) {
    return 0;
  }
  return record->collateral;
}

void relayer_registry::set_locked_collateral(
    const lanebridge::schema::account_id_t& id,
    const lanebridge::schema::amount_t& collateral) {
  auto record = relayer(id);
  if (!record) {
    return;
  }
  record->collateral = collateral;
  storage_.put(encoder_, lanebridge::schema::key::make_relayer_key(id), *record);
  currency_.set_lock(id, collateral);
}

lanebridge::schema::amount_t relayer_registry::occupied_collateral(
    const lanebridge::schema::account_id_t& id) const {
  auto total = lanebridge::schema::amount_t{0};
  for (const auto& order : orders_.open_orders(id)) {
    total += order.locked_collateral;
  }
  return total;
}

std::vector<lanebridge::schema::relayer_t> relayer_registry::relayers() const {
  auto out = std::vector<lanebridge::schema::relayer_t>{};
  const auto prefix = lanebridge::schema::make_bytes(
      lanebridge::schema::key::kRelayerKeyPrefix);
  for (const auto& [key, value] : storage_.list_by_prefix(prefix)) {
    out.push_back(encoder_.decode<lanebridge::schema::relayer_t>(value));
  }
  return out;
}

std::optional<std::vector<lanebridge::schema::relayer_t>>
relayer_registry::assigned_relayers(
    const std::size_t count,
    const lanebridge::schema::amount_t& collateral_per_order) const {
  auto candidates = relayers();
  std::erase_if(candidates, [&](const lanebridge::schema::relayer_t& r) {
    return r.collateral < collateral_per_order;
  });
  if (candidates.size() < count) {
    return std::nullopt;
  }
  std::ranges::sort(candidates, [](const auto& lhs, const auto& rhs) {
    if (lhs.fee != rhs.fee) {
      return lhs.fee < rhs.fee;
    }
    return lhs.enrolled_at < rhs.enrolled_at;
  });
  candidates.resize(count);
  return candidates;
}

std::optional<lanebridge::schema::amount_t> relayer_registry::market_fee(
    const std::size_t count,
    const lanebridge::schema::amount_t& collateral_per_order) const {
  auto assigned = assigned_relayers(count, collateral_per_order);
  if (!assigned || assigned->empty()) {
    return std::nullopt;
  }
  return assigned->back().fee;
}

}  // namespace lanebridge::reward
