#include <lanebridge/lane/outbound_lane.hpp>
#include <lanebridge/schema/key/storage_keys.hpp>

#include <spdlog/spdlog.h>

namespace lanebridge::lane {

namespace {

bool relayers_cover(
    const std::vector<lanebridge::schema::unrewarded_relayer_t>& relayers,
    const lanebridge::schema::message_nonce_t first,
    const lanebridge::schema::message_nonce_t last) {
  if (relayers.empty()) {
    return false;
  }
  auto previous_end = std::optional<lanebridge::schema::message_nonce_t>{};
  for (const auto& entry : relayers) {
    if (entry.messages.end < entry.messages.begin) {
      return false;
    }
    if (previous_end && *previous_end + 1 != entry.messages.begin) {
      return false;
    }
    if (entry.messages.end > last) {
      return false;
    }
    previous_end = entry.messages.end;
  }
  return relayers.front().messages.begin <= first &&
         relayers.back().messages.end == last;
}

}  // namespace

outbound_lane::outbound_lane(
    lanebridge::schema::encoding::scale_encoder_t& encoder,
    lanebridge::storage::rocksdb_storage_t& storage,
    const std::string_view pallet,
    const lanebridge::schema::lane_id_t& lane)
    : encoder_{encoder}, storage_{storage}, pallet_{pallet}, lane_{lane} {}

lanebridge::schema::outbound_lane_data_t outbound_lane::data() const {
  const auto key = lanebridge::schema::key::outbound_lane_data_key(pallet_, lane_);
  return storage_.get<lanebridge::schema::outbound_lane_data_t>(encoder_, key)
      .value_or(lanebridge::schema::outbound_lane_data_t{});
}

void outbound_lane::store(const lanebridge::schema::outbound_lane_data_t& data) {
  const auto key = lanebridge::schema::key::outbound_lane_data_key(pallet_, lane_);
  storage_.put(encoder_, key, data);
}

lanebridge::schema::message_nonce_t outbound_lane::send_message(
    const lanebridge::schema::message_data_t& message) {
  auto lane_data = data();
  const auto nonce = lane_data.latest_generated_nonce + 1;
  storage_.put(encoder_,
               lanebridge::schema::key::outbound_message_key(pallet_, lane_, nonce),
               message);
  lane_data.latest_generated_nonce = nonce;
  store(lane_data);
  return nonce;
}

std::optional<lanebridge::schema::message_data_t> outbound_lane::message(
    const lanebridge::schema::message_nonce_t nonce) const {
  return storage_.get<lanebridge::schema::message_data_t>(
      encoder_,
      lanebridge::schema::key::outbound_message_key(pallet_, lane_, nonce));
}

std::optional<lanebridge::schema::delivered_messages_t>
outbound_lane::confirm_delivery(
    const uint64_t max_allowed_messages,
    const lanebridge::schema::message_nonce_t latest_delivered_nonce,
    const std::vector<lanebridge::schema::unrewarded_relayer_t>& relayers,
    lanebridge::schema::bridge_error_code_t& error) {
  using lanebridge::schema::bridge_error_code_t;

  auto lane_data = data();
  error = bridge_error_code_t::ok;
  if (latest_delivered_nonce <= lane_data.latest_received_nonce) {
    return std::nullopt;
  }
  if (latest_delivered_nonce > lane_data.latest_generated_nonce) {
    error = bridge_error_code_t::confirming_more_than_generated;
    return std::nullopt;
  }
  const auto confirmed = lanebridge::schema::delivered_messages_t{
      lane_data.latest_received_nonce + 1, latest_delivered_nonce};
  if (confirmed.total_messages() > max_allowed_messages) {
    error = bridge_error_code_t::too_many_messages_in_proof;
    return std::nullopt;
  }
  if (!relayers_cover(relayers, confirmed.begin, confirmed.end)) {
    error = bridge_error_code_t::invalid_unrewarded_relayers;
    return std::nullopt;
  }

  lane_data.latest_received_nonce = latest_delivered_nonce;
  store(lane_data);
  spdlog::info("Lane {} confirmed messages [{}, {}]",
               lanebridge::schema::to_hex(lane_), confirmed.begin,
               confirmed.end);
  return confirmed;
}

uint64_t outbound_lane::prune_messages(
    const uint64_t max_messages,
    const std::function<bool(lanebridge::schema::message_nonce_t)>& settled) {
  auto lane_data = data();
  auto pruned = uint64_t{0};
  while (pruned < max_messages &&
         lane_data.oldest_unpruned_nonce <= lane_data.latest_received_nonce &&
         settled(lane_data.oldest_unpruned_nonce)) {
    storage_.erase(lanebridge::schema::key::outbound_message_key(
        pallet_, lane_, lane_data.oldest_unpruned_nonce));
    ++lane_data.oldest_unpruned_nonce;
    ++pruned;
  }
  if (pruned > 0) {
    store(lane_data);
  }
  return pruned;
}

}  // namespace lanebridge::lane
