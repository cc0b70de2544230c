#include <lanebridge/lane/inbound_lane.hpp>
#include <lanebridge/schema/key/storage_keys.hpp>

#include <spdlog/spdlog.h>

namespace lanebridge::lane {

inbound_lane::inbound_lane(
    lanebridge::schema::encoding::scale_encoder_t& encoder,
    lanebridge::storage::rocksdb_storage_t& storage,
    const std::string_view pallet,
    const lanebridge::schema::lane_id_t& lane,
    const uint64_t max_unrewarded_relayers)
    : encoder_{encoder},
      storage_{storage},
      pallet_{pallet},
      lane_{lane},
      max_unrewarded_relayers_{max_unrewarded_relayers} {}

lanebridge::schema::inbound_lane_data_t inbound_lane::data() const {
  const auto key = lanebridge::schema::key::inbound_lane_data_key(pallet_, lane_);
  return storage_.get<lanebridge::schema::inbound_lane_data_t>(encoder_, key)
      .value_or(lanebridge::schema::inbound_lane_data_t{});
}

void inbound_lane::store(const lanebridge::schema::inbound_lane_data_t& data) {
  const auto key = lanebridge::schema::key::inbound_lane_data_key(pallet_, lane_);
  storage_.put(encoder_, key, data);
}

std::size_t inbound_lane::trim_confirmed(
    lanebridge::schema::inbound_lane_data_t& lane_data,
    const lanebridge::schema::message_nonce_t latest_received_nonce,
    bool& changed) const {
  changed = false;
  if (latest_received_nonce > lane_data.last_confirmed_nonce) {
    spdlog::warn("Lane {} source claims nonce {} beyond delivered {}",
                 lanebridge::schema::to_hex(lane_), latest_received_nonce,
                 lane_data.last_confirmed_nonce);
    return 0;
  }

  auto removed = std::size_t{0};
  auto& relayers = lane_data.relayers;
  while (!relayers.empty() &&
         relayers.front().messages.end <= latest_received_nonce) {
    relayers.erase(relayers.begin());
    ++removed;
  }
  if (!relayers.empty() &&
      relayers.front().messages.begin <= latest_received_nonce) {
    relayers.front().messages.begin = latest_received_nonce + 1;
    changed = true;
  }
  changed = changed || removed > 0;
  return removed;
}

std::size_t inbound_lane::receive_state_update(
    const lanebridge::schema::message_nonce_t latest_received_nonce) {
  auto lane_data = data();
  auto changed = false;
  const auto removed =
      trim_confirmed(lane_data, latest_received_nonce, changed);
  if (changed) {
    store(lane_data);
  }
  return removed;
}

std::optional<receive_result_t> inbound_lane::receive_messages(
    const lanebridge::schema::account_id_t& relayer,
    const std::vector<lanebridge::schema::message_t>& messages,
    lanebridge::dispatch::dispatcher& dispatcher,
    lanebridge::schema::bridge_error_code_t& error,
    const std::optional<lanebridge::schema::message_nonce_t>
        latest_received_nonce) {
  using lanebridge::schema::bridge_error_code_t;

  auto lane_data = data();
  if (latest_received_nonce) {
    // Applied in memory; stored together with the delivery below.
    auto changed = false;
    trim_confirmed(lane_data, *latest_received_nonce, changed);
  }
  if (messages.empty()) {
    error = bridge_error_code_t::proof_empty;
    return std::nullopt;
  }
  const auto first = messages.front().key.nonce;
  const auto last = messages.back().key.nonce;
  if (last <= lane_data.last_confirmed_nonce) {
    spdlog::info("Lane {} ignoring already delivered range [{}, {}]",
                 lanebridge::schema::to_hex(lane_), first, last);
    error = bridge_error_code_t::duplicate_message;
    return std::nullopt;
  }
  if (first != lane_data.last_confirmed_nonce + 1) {
    error = bridge_error_code_t::out_of_order_nonce;
    return std::nullopt;
  }
  for (std::size_t i = 1; i < messages.size(); ++i) {
    if (messages[i].key.nonce != messages[i - 1].key.nonce + 1) {
      error = bridge_error_code_t::out_of_order_nonce;
      return std::nullopt;
    }
  }
  const auto merges = !lane_data.relayers.empty() &&
                      lane_data.relayers.back().relayer == relayer;
  if (!merges && lane_data.relayers.size() >= max_unrewarded_relayers_) {
    error = bridge_error_code_t::too_many_unrewarded_relayers;
    return std::nullopt;
  }

  auto result = receive_result_t{};
  result.events.reserve(messages.size());
  for (const auto& message : messages) {
    auto payload =
        encoder_.try_decode<lanebridge::schema::message_payload_t>(
            message.data.payload);
    result.events.push_back(dispatcher.dispatch(relayer, message.key, payload));
  }

  if (merges) {
    lane_data.relayers.back().messages.end = last;
  } else {
    lane_data.relayers.push_back(lanebridge::schema::unrewarded_relayer_t{
        relayer, lanebridge::schema::delivered_messages_t{first, last}});
  }
  result.advance = lanebridge::schema::lane_advance_t{
      lane_, lane_data.last_confirmed_nonce, last};
  lane_data.last_confirmed_nonce = last;
  store(lane_data);

  spdlog::info("Lane {} advanced {} -> {}", lanebridge::schema::to_hex(lane_),
               result.advance.previous_nonce, result.advance.new_nonce);
  error = bridge_error_code_t::ok;
  return result;
}

}  // namespace lanebridge::lane
