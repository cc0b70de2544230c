#pragma once

#include <lanebridge/schema/primitives.hpp>

#include <compare>

// Schema type: bridged message.
// A message is addressed by (lane, nonce) and carries an opaque payload plus
// the delivery fee paid at the source chain.
namespace lanebridge::schema {

struct message_key final {
  lane_id_t lane{};
  message_nonce_t nonce{};

  auto operator<=>(const message_key&) const = default;
};

using message_key_t = message_key;

/// Value stored under the outbound message key; field order is the proof
/// wire order (fee first).
struct message_data final {
  amount_t fee{};
  bytes_t payload;

  bool operator==(const message_data&) const = default;
};

using message_data_t = message_data;

struct message final {
  message_key_t key;
  message_data_t data;

  bool operator==(const message&) const = default;
};

using message_t = message;

}  // namespace lanebridge::schema
