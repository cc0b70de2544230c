#pragma once

#include <lanebridge/schema/primitives.hpp>

#include <cstdint>
#include <vector>

// Schema type: lane bookkeeping records.
// Outbound data lives on the sending chain, inbound data on the receiving
// chain; each is proved to the opposite side.
namespace lanebridge::schema {

/// Inclusive nonce range [begin, end].
struct delivered_messages final {
  message_nonce_t begin{};
  message_nonce_t end{};

  uint64_t total_messages() const {
    return end >= begin ? (end - begin) + 1 : 0;
  }

  bool contains(const message_nonce_t nonce) const {
    return nonce >= begin && nonce <= end;
  }

  bool operator==(const delivered_messages&) const = default;
};

using delivered_messages_t = delivered_messages;

/// Relayer that delivered a nonce range which has not been rewarded yet.
struct unrewarded_relayer final {
  account_id_t relayer{};
  delivered_messages_t messages;

  bool operator==(const unrewarded_relayer&) const = default;
};

using unrewarded_relayer_t = unrewarded_relayer;

struct outbound_lane_data final {
  /// Nonce of the oldest message still kept in storage.
  message_nonce_t oldest_unpruned_nonce{1};
  /// Highest nonce the bridged chain has confirmed receiving.
  message_nonce_t latest_received_nonce{};
  /// Nonce assigned to the most recently accepted message.
  message_nonce_t latest_generated_nonce{};

  uint64_t pending_messages() const {
    return latest_generated_nonce - latest_received_nonce;
  }

  bool operator==(const outbound_lane_data&) const = default;
};

using outbound_lane_data_t = outbound_lane_data;

struct inbound_lane_data final {
  std::vector<unrewarded_relayer_t> relayers;
  message_nonce_t last_confirmed_nonce{};

  bool operator==(const inbound_lane_data&) const = default;
};

using inbound_lane_data_t = inbound_lane_data;

/// Produced once per processed batch.
struct lane_advance final {
  lane_id_t lane{};
  message_nonce_t previous_nonce{};
  message_nonce_t new_nonce{};

  bool operator==(const lane_advance&) const = default;
};

using lane_advance_t = lane_advance;

}  // namespace lanebridge::schema
