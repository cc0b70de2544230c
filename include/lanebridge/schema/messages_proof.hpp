#pragma once

#include <lanebridge/schema/lane_data.hpp>
#include <lanebridge/schema/message.hpp>
#include <lanebridge/schema/primitives.hpp>

#include <map>
#include <optional>
#include <vector>

// Schema type: storage proofs exchanged by relayers.
namespace lanebridge::schema {

/// Proof of messages [nonces_start, nonces_end] (and optionally the outbound
/// lane state) at the bridged chain header `finalized_header_hash`.
struct messages_proof final {
  hash32_t finalized_header_hash{};
  std::vector<bytes_t> storage_proof;
  lane_id_t lane{};
  message_nonce_t nonces_start{};
  message_nonce_t nonces_end{};

  bool operator==(const messages_proof&) const = default;
};

using messages_proof_t = messages_proof;

/// Proof of the inbound lane state at the bridged chain.
struct messages_delivery_proof final {
  hash32_t finalized_header_hash{};
  std::vector<bytes_t> storage_proof;
  lane_id_t lane{};

  bool operator==(const messages_delivery_proof&) const = default;
};

using messages_delivery_proof_t = messages_delivery_proof;

struct proved_lane_messages final {
  std::optional<outbound_lane_data_t> lane_state;
  std::vector<message_t> messages;
};

using proved_lane_messages_t = proved_lane_messages;
using proved_messages_t = std::map<lane_id_t, proved_lane_messages_t>;

}  // namespace lanebridge::schema
