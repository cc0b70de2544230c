#include <lanebridge/reward/order_book.hpp>
#include <lanebridge/schema/key/fee_market_keys.hpp>

#include <algorithm>
#include <spdlog/spdlog.h>

namespace lanebridge::reward {

order_book::order_book(lanebridge::schema::encoding::scale_encoder_t& encoder,
                       lanebridge::storage::rocksdb_storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

lanebridge::schema::order_t order_book::create_order(
    const lanebridge::schema::lane_id_t& lane,
    const lanebridge::schema::message_nonce_t nonce,
    const lanebridge::schema::amount_t& fee,
    const lanebridge::schema::block_number_t sent_time,
    const std::vector<lanebridge::schema::relayer_t>& assigned,
    const lanebridge::schema::block_number_t slot_length,
    const lanebridge::schema::amount_t& collateral_per_order) {
  auto value = lanebridge::schema::order_t{};
  value.lane = lane;
  value.nonce = nonce;
  value.fee = fee;
  value.sent_time = sent_time;
  value.locked_collateral = collateral_per_order;
  auto start = sent_time;
  for (const auto& relayer : assigned) {
    value.relayers.push_back(lanebridge::schema::priority_relayer_t{
        relayer.id, relayer.fee, start, start + slot_length});
    start += slot_length;
  }
  storage_.put(encoder_, lanebridge::schema::key::make_order_key(lane, nonce),
               value);
  return value;
}

std::optional<lanebridge::schema::order_t> order_book::order(
    const lanebridge::schema::lane_id_t& lane,
    const lanebridge::schema::message_nonce_t nonce) const {
  return storage_.get<lanebridge::schema::order_t>(
      encoder_, lanebridge::schema::key::make_order_key(lane, nonce));
}

void order_book::confirm(const lanebridge::schema::lane_id_t& lane,
                         const lanebridge::schema::delivered_messages_t& range,
                         const lanebridge::schema::block_number_t confirm_time) {
  if (range.total_messages() == 0) {
    return;
  }
  for (auto nonce = range.begin;; ++nonce) {
    if (auto value = order(lane, nonce)) {
      value->confirm_time = confirm_time;
      storage_.put(encoder_,
                   lanebridge::schema::key::make_order_key(lane, nonce), *value);
    } else {
      spdlog::warn("No order for confirmed message {}", nonce);
    }
    if (nonce == range.end) {
      break;
    }
  }
}

void order_book::settle(const lanebridge::schema::lane_id_t& lane,
                        const lanebridge::schema::message_nonce_t nonce) {
  storage_.erase(lanebridge::schema::key::make_order_key(lane, nonce));
}

std::vector<lanebridge::schema::order_t> order_book::open_orders(
    const lanebridge::schema::account_id_t& relayer) const {
  auto out = std::vector<lanebridge::schema::order_t>{};
  const auto prefix =
      lanebridge::schema::make_bytes(lanebridge::schema::key::kOrderKeyPrefix);
  for (const auto& [key, value] : storage_.list_by_prefix(prefix)) {
    auto entry = encoder_.decode<lanebridge::schema::order_t>(value);
    const auto assigned = std::ranges::any_of(
        entry.relayers, [&](const lanebridge::schema::priority_relayer_t& slot) {
          return slot.id == relayer;
        });
    if (assigned) {
      out.push_back(std::move(entry));
    }
  }
  return out;
}

bool order_book::is_settled(const lanebridge::schema::lane_id_t& lane,
                            const lanebridge::schema::message_nonce_t nonce) const {
  return !order(lane, nonce).has_value();
}

}  // namespace lanebridge::reward
