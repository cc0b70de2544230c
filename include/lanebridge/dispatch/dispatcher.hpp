#pragma once

#include <lanebridge/dispatch/call_runtime.hpp>
#include <lanebridge/schema/dispatch_event.hpp>
#include <lanebridge/schema/message.hpp>
#include <lanebridge/schema/message_payload.hpp>
#include <lanebridge/schema/primitives.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace lanebridge::dispatch {

/// Policy hook run before weight checks. Returns the policy error, if any.
using call_validator_t = std::function<std::optional<std::string>(
    const lanebridge::schema::account_id_t& relayer,
    const lanebridge::schema::account_id_t& origin,
    const lanebridge::schema::call_t& call)>;

/// Checks the signature proving ownership of a TargetAccount origin. Defaults
/// to lanebridge::crypto::verify_signature.
using signature_verifier_t =
    std::function<bool(const lanebridge::schema::bytes_view_t& message,
                       const lanebridge::schema::signer_id_t& signer,
                       const lanebridge::schema::signature_t& signature)>;

/// Withdraws the dispatch fee for `weight` from `origin`.
using dispatch_fee_payer_t =
    std::function<bool(const lanebridge::schema::account_id_t& origin,
                       const lanebridge::schema::weight_t& weight)>;

struct dispatch_settings final {
  /// Chain the messages come from.
  lanebridge::schema::chain_id_t source_chain{};
  /// Chain executing them.
  lanebridge::schema::chain_id_t target_chain{};
  uint32_t spec_version{};
};

using dispatch_settings_t = dispatch_settings;

/// Turns one verified message into at most one call execution.
///
/// Each message runs through version check, call decode, origin derivation,
/// the validation hook, the weight check, dispatch fee withdrawal and
/// finally execution. The first failing step rejects the message; every
/// message yields exactly one dispatch_event_t.
class dispatcher final {
 public:
  dispatcher(dispatch_settings_t settings, call_runtime& runtime);

  void set_call_validator(call_validator_t validator);
  void set_dispatch_fee_payer(dispatch_fee_payer_t payer);
  void set_signature_verifier(signature_verifier_t verifier);

  /// `payload` is empty when the message failed lane-level pre-validation.
  lanebridge::schema::dispatch_event_t dispatch(
      const lanebridge::schema::account_id_t& relayer,
      const lanebridge::schema::message_key_t& id,
      const std::optional<lanebridge::schema::message_payload_t>& payload);

  const dispatch_settings_t& settings() const { return settings_; }

 private:
  lanebridge::schema::dispatch_event_t reject(
      const lanebridge::schema::message_key_t& id,
      lanebridge::schema::bridge_error_code_t error,
      lanebridge::schema::weight_t unspent,
      std::string detail = {}) const;

  dispatch_settings_t settings_;
  call_runtime& runtime_;
  call_validator_t call_validator_;
  dispatch_fee_payer_t dispatch_fee_payer_;
  signature_verifier_t signature_verifier_;
};

}  // namespace lanebridge::dispatch
