#pragma once

#include <lanebridge/schema/bridge_error_code.hpp>
#include <lanebridge/schema/enum_string.hpp>
#include <lanebridge/schema/message.hpp>
#include <lanebridge/schema/primitives.hpp>
#include <lanebridge/schema/weight.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: dispatch outcome.
namespace lanebridge::schema {

struct message_dispatch_result final {
  /// True when the call was executed and succeeded.
  bool dispatch_result{};
  weight_t unspent_weight;
  bool dispatch_fee_paid_during_dispatch{};
};

using message_dispatch_result_t = message_dispatch_result;

enum class dispatch_status : uint8_t {
  /// Executed, call succeeded.
  dispatched = 0,
  /// Executed, call returned an error.
  failed = 1,
  /// Never executed.
  rejected = 2
};

using dispatch_status_t = dispatch_status;

using dispatch_status_mapping_t = enum_mapping_t<dispatch_status_t>;

inline constexpr auto kDispatchStatusMappings = std::array{
    dispatch_status_mapping_t{"dispatched", dispatch_status_t::dispatched},
    dispatch_status_mapping_t{"failed", dispatch_status_t::failed},
    dispatch_status_mapping_t{"rejected", dispatch_status_t::rejected}};

template <>
inline std::optional<dispatch_status_t> try_from_string<dispatch_status_t>(
    const std::string_view value) {
  return from_string(value, kDispatchStatusMappings);
}

inline constexpr std::string_view to_string(const dispatch_status_t value) {
  return name_of(value, kDispatchStatusMappings);
}

/// Terminal event, exactly one per delivered message.
struct dispatch_event final {
  chain_id_t source_chain{};
  message_key_t message_id;
  dispatch_status_t status{dispatch_status_t::rejected};
  std::optional<bridge_error_code_t> error;
  /// Policy or call error text, when there is one.
  std::string detail;
  message_dispatch_result_t result;
};

using dispatch_event_t = dispatch_event;

}  // namespace lanebridge::schema
