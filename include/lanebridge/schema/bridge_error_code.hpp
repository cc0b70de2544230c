#pragma once

#include <lanebridge/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace lanebridge::schema {

enum class bridge_error_code : uint32_t {
  ok = 0,
  ancient_header = 1,
  duplicate_message = 2,
  version_mismatch = 3,
  decode_failure = 4,
  signature_mismatch = 5,
  origin_rejected = 6,
  weight_mismatch = 7,
  fee_payment_failed = 8,
  proof_empty = 9,
  proof_count_mismatch = 10,
  proof_missing_message = 11,
  proof_decode_failure = 12,
  out_of_order_nonce = 13,
  slash_transfer_failed = 14,
  known_header = 20,
  too_far_in_future = 21,
  unknown_header = 22,
  storage_root_mismatch = 23,
  too_many_pending_messages = 24,
  message_too_large = 25,
  fee_too_low = 26,
  market_unavailable = 27,
  lane_rejected = 28,
  too_many_unrewarded_relayers = 29,
  too_many_messages_in_proof = 30,
  confirming_more_than_generated = 31,
  invalid_unrewarded_relayers = 32,
  message_rejected = 33,
  call_failed = 34,
  invalid_dispatch_weight = 35,
  relayer_already_enrolled = 36,
  relayer_not_enrolled = 37,
  insufficient_balance = 38,
  insufficient_collateral = 39,
  relayer_occupied = 40,
};

using bridge_error_code_t = bridge_error_code;

using bridge_error_mapping_t = enum_mapping_t<bridge_error_code_t>;

inline constexpr auto kBridgeErrorCodeMappings = std::array{
    bridge_error_mapping_t{"ok", bridge_error_code_t::ok},
    bridge_error_mapping_t{"ancient_header",
                           bridge_error_code_t::ancient_header},
    bridge_error_mapping_t{"duplicate_message",
                           bridge_error_code_t::duplicate_message},
    bridge_error_mapping_t{"version_mismatch",
                           bridge_error_code_t::version_mismatch},
    bridge_error_mapping_t{"decode_failure",
                           bridge_error_code_t::decode_failure},
    bridge_error_mapping_t{"signature_mismatch",
                           bridge_error_code_t::signature_mismatch},
    bridge_error_mapping_t{"origin_rejected",
                           bridge_error_code_t::origin_rejected},
    bridge_error_mapping_t{"weight_mismatch",
                           bridge_error_code_t::weight_mismatch},
    bridge_error_mapping_t{"fee_payment_failed",
                           bridge_error_code_t::fee_payment_failed},
    bridge_error_mapping_t{"proof_empty", bridge_error_code_t::proof_empty},
    bridge_error_mapping_t{"proof_count_mismatch",
                           bridge_error_code_t::proof_count_mismatch},
    bridge_error_mapping_t{"proof_missing_message",
                           bridge_error_code_t::proof_missing_message},
    bridge_error_mapping_t{"proof_decode_failure",
                           bridge_error_code_t::proof_decode_failure},
    bridge_error_mapping_t{"out_of_order_nonce",
                           bridge_error_code_t::out_of_order_nonce},
    bridge_error_mapping_t{"slash_transfer_failed",
                           bridge_error_code_t::slash_transfer_failed},
    bridge_error_mapping_t{"known_header", bridge_error_code_t::known_header},
    bridge_error_mapping_t{"too_far_in_future",
                           bridge_error_code_t::too_far_in_future},
    bridge_error_mapping_t{"unknown_header",
                           bridge_error_code_t::unknown_header},
    bridge_error_mapping_t{"storage_root_mismatch",
                           bridge_error_code_t::storage_root_mismatch},
    bridge_error_mapping_t{"too_many_pending_messages",
                           bridge_error_code_t::too_many_pending_messages},
    bridge_error_mapping_t{"message_too_large",
                           bridge_error_code_t::message_too_large},
    bridge_error_mapping_t{"fee_too_low", bridge_error_code_t::fee_too_low},
    bridge_error_mapping_t{"market_unavailable",
                           bridge_error_code_t::market_unavailable},
    bridge_error_mapping_t{"lane_rejected", bridge_error_code_t::lane_rejected},
    bridge_error_mapping_t{"too_many_unrewarded_relayers",
                           bridge_error_code_t::too_many_unrewarded_relayers},
    bridge_error_mapping_t{"too_many_messages_in_proof",
                           bridge_error_code_t::too_many_messages_in_proof},
    bridge_error_mapping_t{"confirming_more_than_generated",
                           bridge_error_code_t::confirming_more_than_generated},
    bridge_error_mapping_t{"invalid_unrewarded_relayers",
                           bridge_error_code_t::invalid_unrewarded_relayers},
    bridge_error_mapping_t{"message_rejected",
                           bridge_error_code_t::message_rejected},
    bridge_error_mapping_t{"call_failed", bridge_error_code_t::call_failed},
    bridge_error_mapping_t{"invalid_dispatch_weight",
                           bridge_error_code_t::invalid_dispatch_weight},
    bridge_error_mapping_t{"relayer_already_enrolled",
                           bridge_error_code_t::relayer_already_enrolled},
    bridge_error_mapping_t{"relayer_not_enrolled",
                           bridge_error_code_t::relayer_not_enrolled},
    bridge_error_mapping_t{"insufficient_balance",
                           bridge_error_code_t::insufficient_balance},
    bridge_error_mapping_t{"insufficient_collateral",
                           bridge_error_code_t::insufficient_collateral},
    bridge_error_mapping_t{"relayer_occupied",
                           bridge_error_code_t::relayer_occupied}};

template <>
inline std::optional<bridge_error_code_t> try_from_string<bridge_error_code_t>(
    const std::string_view value) {
  return from_string(value, kBridgeErrorCodeMappings);
}

inline constexpr std::string_view to_string(const bridge_error_code_t value) {
  return name_of(value, kBridgeErrorCodeMappings);
}

/// Codes a header pool may retry later instead of banning the header.
inline constexpr bool is_transient(const bridge_error_code_t value) {
  return value == bridge_error_code_t::too_far_in_future;
}

}  // namespace lanebridge::schema
