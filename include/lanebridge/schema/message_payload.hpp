#pragma once

#include <lanebridge/schema/enum_string.hpp>
#include <lanebridge/schema/primitives.hpp>
#include <lanebridge/schema/weight.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

// Schema type: message payload.
// What the source chain asks the target chain to execute, and on whose
// behalf.
namespace lanebridge::schema {

/// Dispatch under an account derived from the source chain id alone.
struct source_root final {
  bool operator==(const source_root&) const = default;
};

/// Dispatch under an account derived from (source chain id, source account).
struct source_account final {
  account_id_t id{};

  bool operator==(const source_account&) const = default;
};

/// Dispatch under a real target chain account. The signature proves that
/// the owner of `source_id` also controls `target_public`.
struct target_account final {
  account_id_t source_id{};
  signer_id_t target_public;
  signature_t signature;

  bool operator==(const target_account&) const = default;
};

using source_root_t = source_root;
using source_account_t = source_account;
using target_account_t = target_account;
using call_origin_t =
    std::variant<source_root_t, source_account_t, target_account_t>;

/// Origin of whoever submits a message on the source chain.
struct root_origin final {};
struct signed_origin final {
  account_id_t account{};
};
struct none_origin final {};

using root_origin_t = root_origin;
using signed_origin_t = signed_origin;
using none_origin_t = none_origin;
using local_origin_t = std::variant<root_origin_t, signed_origin_t, none_origin_t>;

enum class dispatch_fee_payment : uint8_t {
  at_source_chain = 0,
  at_target_chain = 1
};

using dispatch_fee_payment_t = dispatch_fee_payment;

using dispatch_fee_payment_mapping_t = enum_mapping_t<dispatch_fee_payment_t>;

inline constexpr auto kDispatchFeePaymentMappings = std::array{
    dispatch_fee_payment_mapping_t{"at_source_chain",
                                   dispatch_fee_payment_t::at_source_chain},
    dispatch_fee_payment_mapping_t{"at_target_chain",
                                   dispatch_fee_payment_t::at_target_chain}};

template <>
inline std::optional<dispatch_fee_payment_t>
try_from_string<dispatch_fee_payment_t>(const std::string_view value) {
  return from_string(value, kDispatchFeePaymentMappings);
}

inline constexpr std::string_view to_string(
    const dispatch_fee_payment_t value) {
  return name_of(value, kDispatchFeePaymentMappings);
}

/// Tagged command. The (module_index, call_index) pair selects the command,
/// the arguments are interpreted only by the injected call runtime.
struct call final {
  uint8_t module_index{};
  uint8_t call_index{};
  bytes_t arguments;

  bool operator==(const call&) const = default;
};

using call_t = call;

struct message_payload final {
  uint32_t spec_version{};
  weight_t weight;
  call_origin_t origin;
  dispatch_fee_payment_t dispatch_fee_payment{
      dispatch_fee_payment_t::at_source_chain};
  /// Encoded call_t; opaque to the sending chain.
  bytes_t call;

  bool operator==(const message_payload&) const = default;
};

using message_payload_t = message_payload;

}  // namespace lanebridge::schema
