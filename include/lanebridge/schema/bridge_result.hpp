#pragma once

#include <lanebridge/schema/dispatch_event.hpp>
#include <lanebridge/schema/lane_data.hpp>
#include <lanebridge/schema/order.hpp>
#include <lanebridge/schema/primitives.hpp>
#include <lanebridge/schema/reward_item.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: engine call results.
// `code` is a bridge_error_code value (0 on success), `log` its name or a
// detail message, `codespace` the operation that produced it.
namespace lanebridge::schema {

template <uint16_t Version>
struct send_result;

template <>
struct send_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  std::optional<message_nonce_t> nonce;
  std::optional<order_t> order;
};

using send_result_t = send_result<1>;

template <uint16_t Version>
struct delivery_result;

template <>
struct delivery_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  std::vector<dispatch_event_t> events;
  std::optional<lane_advance_t> advance;
};

using delivery_result_t = delivery_result<1>;

template <uint16_t Version>
struct confirmation_result;

template <>
struct confirmation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  std::optional<delivered_messages_t> confirmed;
  std::vector<order_reward_t> rewards;
  std::vector<slash_report_t> slashes;
  uint64_t pruned{};
};

using confirmation_result_t = confirmation_result<1>;

}  // namespace lanebridge::schema
