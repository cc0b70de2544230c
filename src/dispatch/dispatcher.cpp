#include <lanebridge/crypto/verify.hpp>
#include <lanebridge/dispatch/dispatcher.hpp>
#include <lanebridge/dispatch/origin.hpp>
#include <lanebridge/schema/encoding/scale/encoder.hpp>

#include <spdlog/spdlog.h>

#include <variant>

namespace lanebridge::dispatch {

dispatcher::dispatcher(dispatch_settings_t settings, call_runtime& runtime)
    : settings_{settings},
      runtime_{runtime},
      signature_verifier_{lanebridge::crypto::verify_signature} {}

void dispatcher::set_call_validator(call_validator_t validator) {
  call_validator_ = std::move(validator);
}

void dispatcher::set_dispatch_fee_payer(dispatch_fee_payer_t payer) {
  dispatch_fee_payer_ = std::move(payer);
}

void dispatcher::set_signature_verifier(signature_verifier_t verifier) {
  signature_verifier_ = std::move(verifier);
}

lanebridge::schema::dispatch_event_t dispatcher::reject(
    const lanebridge::schema::message_key_t& id,
    const lanebridge::schema::bridge_error_code_t error,
    const lanebridge::schema::weight_t unspent,
    std::string detail) const {
  spdlog::warn("Message {} rejected: {}{}{}", id.nonce,
               lanebridge::schema::to_string(error), detail.empty() ? "" : ": ",
               detail);
  auto event = lanebridge::schema::dispatch_event_t{};
  event.source_chain = settings_.source_chain;
  event.message_id = id;
  event.status = lanebridge::schema::dispatch_status_t::rejected;
  event.error = error;
  event.detail = std::move(detail);
  event.result.dispatch_result = false;
  event.result.unspent_weight = unspent;
  return event;
}

lanebridge::schema::dispatch_event_t dispatcher::dispatch(
    const lanebridge::schema::account_id_t& relayer,
    const lanebridge::schema::message_key_t& id,
    const std::optional<lanebridge::schema::message_payload_t>& payload) {
  using lanebridge::schema::bridge_error_code_t;

  if (!payload) {
    return reject(id, bridge_error_code_t::message_rejected,
                  lanebridge::schema::weight_t::zero());
  }

  const auto declared = payload->weight;
  if (payload->spec_version != settings_.spec_version) {
    return reject(id, bridge_error_code_t::version_mismatch, declared,
                  fmt::format("expected {}, got {}", settings_.spec_version,
                              payload->spec_version));
  }

  auto encoder = lanebridge::schema::encoding::scale_encoder_t{};
  auto call = encoder.try_decode<lanebridge::schema::call_t>(payload->call);
  if (!call) {
    return reject(id, bridge_error_code_t::decode_failure, declared);
  }

  auto origin = std::visit(
      overloaded{
          [&](const lanebridge::schema::source_root_t&)
              -> std::optional<lanebridge::schema::account_id_t> {
            return derive_source_root_account(settings_.source_chain);
          },
          [&](const lanebridge::schema::source_account_t& o)
              -> std::optional<lanebridge::schema::account_id_t> {
            return derive_source_account(settings_.source_chain, o.id);
          },
          [&](const lanebridge::schema::target_account_t& o)
              -> std::optional<lanebridge::schema::account_id_t> {
            const auto digest = ownership_digest(
                payload->call, o.source_id, payload->spec_version,
                settings_.source_chain, settings_.target_chain);
            if (!signature_verifier_ ||
                !signature_verifier_(digest, o.target_public, o.signature)) {
              return std::nullopt;
            }
            return derive_target_account(o.target_public);
          }},
      payload->origin);
  if (!origin) {
    return reject(id, bridge_error_code_t::signature_mismatch, declared);
  }

  if (call_validator_) {
    if (auto policy_error = call_validator_(relayer, *origin, *call)) {
      return reject(id, bridge_error_code_t::origin_rejected, declared,
                    std::move(*policy_error));
    }
  }

  const auto minimal = runtime_.minimal_weight(*call);
  if (declared < minimal) {
    return reject(id, bridge_error_code_t::weight_mismatch, declared,
                  fmt::format("declared {}, minimal {}", declared.ref_time(),
                              minimal.ref_time()));
  }

  auto fee_paid = false;
  if (payload->dispatch_fee_payment ==
      lanebridge::schema::dispatch_fee_payment_t::at_target_chain) {
    if (!dispatch_fee_payer_ || !dispatch_fee_payer_(*origin, declared)) {
      return reject(id, bridge_error_code_t::fee_payment_failed, declared);
    }
    fee_paid = true;
  }

  auto outcome = runtime_.execute(*origin, *call);
  const auto actual = outcome.actual_weight.value_or(declared);

  auto event = lanebridge::schema::dispatch_event_t{};
  event.source_chain = settings_.source_chain;
  event.message_id = id;
  event.result.dispatch_result = outcome.success;
  event.result.unspent_weight = declared.saturating_sub(actual);
  event.result.dispatch_fee_paid_during_dispatch = fee_paid;
  if (outcome.success) {
    event.status = lanebridge::schema::dispatch_status_t::dispatched;
    spdlog::debug("Message {} dispatched, unspent weight {}", id.nonce,
                  event.result.unspent_weight.ref_time());
  } else {
    event.status = lanebridge::schema::dispatch_status_t::failed;
    event.error = bridge_error_code_t::call_failed;
    event.detail = std::move(outcome.error);
    spdlog::warn("Message {} call failed: {}", id.nonce, event.detail);
  }
  return event;
}

}  // namespace lanebridge::dispatch
