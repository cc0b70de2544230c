#include <lanebridge/dispatch/origin.hpp>
#include <lanebridge/execution/engine.hpp>
#include <lanebridge/lane/inbound_lane.hpp>
#include <lanebridge/lane/outbound_lane.hpp>

#include <spdlog/spdlog.h>

namespace lanebridge::execution {

namespace {

inline constexpr std::string_view kSendCodespace{"lanebridge.send"};
inline constexpr std::string_view kDeliveryCodespace{"lanebridge.delivery"};
inline constexpr std::string_view kConfirmationCodespace{
    "lanebridge.confirmation"};

template <typename Result>
Result make_error_result(const lanebridge::schema::bridge_error_code_t code,
                         const std::string_view codespace) {
  auto result = Result{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{lanebridge::schema::to_string(code)};
  result.codespace = std::string{codespace};
  return result;
}

lanebridge::dispatch::dispatch_settings_t make_dispatch_settings(
    const lanebridge::config::bridge_config_t& config) {
  return lanebridge::dispatch::dispatch_settings_t{
      config.bridged_chain, config.this_chain, config.spec_version};
}

lanebridge::reward::reward_settings_t make_reward_settings(
    const lanebridge::config::bridge_config_t& config) {
  auto settings = lanebridge::reward::reward_settings_t{};
  settings.fund_account = config.fund_account;
  settings.treasury_account = config.treasury_account;
  settings.base_fee_ratio = config.relayer_fee_ratio;
  settings.assigned_relayers_reward_ratio = config.assigned_relayers_reward_ratio;
  settings.message_relayers_reward_ratio = config.message_relayers_reward_ratio;
  settings.assigned_relayer_slash_ratio = config.assigned_relayer_slash_ratio;
  settings.collateral_slash_protect = config.collateral_slash_protect;
  return settings;
}

}  // namespace

engine::engine(lanebridge::schema::encoding::scale_encoder_t& encoder,
               lanebridge::storage::rocksdb_storage_t& storage,
               lanebridge::config::bridge_config_t config,
               const lanebridge::proof::finality_source& finality,
               lanebridge::dispatch::call_runtime& runtime,
               lanebridge::reward::currency& currency)
    : encoder_{encoder},
      storage_{storage},
      config_{std::move(config)},
      verifier_{finality, config_.bridged_pallet},
      dispatcher_{make_dispatch_settings(config_), runtime},
      this_chain_{std::make_unique<lanebridge::lane::configured_this_chain>(
          config_.lanes, config_.max_pending_messages)},
      bridged_chain_{std::make_unique<lanebridge::lane::configured_bridged_chain>(
          config_.max_extrinsic_size, config_.max_extrinsic_weight)},
      slasher_{config_.slash_per_block},
      orders_{encoder, storage},
      registry_{encoder, storage, currency, orders_},
      ledger_{make_reward_settings(config_), currency, slasher_, registry_,
              orders_} {
  if (auto invalid = lanebridge::config::validate(config_)) {
    lanebridge::common::critical("Invalid bridge configuration: {}", *invalid);
  }
}

void engine::set_this_chain_capabilities(
    std::unique_ptr<lanebridge::lane::this_chain_capabilities> capabilities) {
  this_chain_ = std::move(capabilities);
}

void engine::set_bridged_chain_capabilities(
    std::unique_ptr<lanebridge::lane::bridged_chain_capabilities> capabilities) {
  bridged_chain_ = std::move(capabilities);
}

lanebridge::schema::send_result_t engine::send_message(
    const lanebridge::schema::local_origin_t& submitter,
    const lanebridge::schema::lane_id_t& lane,
    const lanebridge::schema::message_payload_t& payload,
    const lanebridge::schema::amount_t& fee,
    const lanebridge::schema::block_number_t now) {
  using lanebridge::schema::bridge_error_code_t;
  using result_t = lanebridge::schema::send_result_t;

  if (!this_chain_->accepts(submitter, lane)) {
    return make_error_result<result_t>(bridge_error_code_t::lane_rejected,
                                       kSendCodespace);
  }
  if (!lanebridge::dispatch::verify_message_origin(submitter, payload)) {
    return make_error_result<result_t>(bridge_error_code_t::origin_rejected,
                                       kSendCodespace);
  }

  auto outbound = lanebridge::lane::outbound_lane{encoder_, storage_,
                                                  config_.pallet, lane};
  if (outbound.data().pending_messages() >= this_chain_->max_pending()) {
    return make_error_result<result_t>(
        bridge_error_code_t::too_many_pending_messages, kSendCodespace);
  }

  const auto encoded = encoder_.encode(payload);
  if (encoded.size() > lanebridge::lane::maximal_message_size(
                           bridged_chain_->max_extrinsic_size())) {
    return make_error_result<result_t>(bridge_error_code_t::message_too_large,
                                       kSendCodespace);
  }
  if (!bridged_chain_->verify_dispatch_weight(encoded, payload.weight)) {
    return make_error_result<result_t>(
        bridge_error_code_t::invalid_dispatch_weight, kSendCodespace);
  }

  auto assigned = registry_.assigned_relayers(config_.assigned_relayers_number,
                                              config_.collateral_per_order);
  if (!assigned) {
    return make_error_result<result_t>(bridge_error_code_t::market_unavailable,
                                       kSendCodespace);
  }
  if (fee < assigned->back().fee) {
    auto result = make_error_result<result_t>(bridge_error_code_t::fee_too_low,
                                              kSendCodespace);
    result.log += ": market fee is " + assigned->back().fee.str();
    return result;
  }
  if (!ledger_.pay_delivery_and_dispatch_fee(submitter, fee)) {
    return make_error_result<result_t>(bridge_error_code_t::fee_payment_failed,
                                       kSendCodespace);
  }

  auto result = result_t{};
  result.codespace = std::string{kSendCodespace};
  result.nonce = outbound.send_message(
      lanebridge::schema::message_data_t{fee, encoded});
  result.order =
      orders_.create_order(lane, *result.nonce, fee, now, *assigned,
                           config_.slot_length, config_.collateral_per_order);
  spdlog::info("Accepted message {} on lane {} with fee {}", *result.nonce,
               lanebridge::schema::to_hex(lane), fee.str());
  return result;
}

lanebridge::schema::delivery_result_t engine::receive_messages_proof(
    const lanebridge::schema::account_id_t& relayer,
    const lanebridge::schema::messages_proof_t& proof,
    const uint64_t messages_count) {
  using lanebridge::schema::bridge_error_code_t;
  using result_t = lanebridge::schema::delivery_result_t;

  auto error = bridge_error_code_t::ok;
  auto proved = verifier_.verify_messages_proof(proof, messages_count, error);
  if (!proved) {
    spdlog::warn("Messages proof rejected: {}",
                 lanebridge::schema::to_string(error));
    return make_error_result<result_t>(error, kDeliveryCodespace);
  }

  auto result = result_t{};
  result.codespace = std::string{kDeliveryCodespace};
  for (const auto& [lane_id, lane_messages] : *proved) {
    auto inbound = lanebridge::lane::inbound_lane{
        encoder_, storage_, config_.pallet, lane_id,
        config_.max_unrewarded_relayers};
    auto latest_received_nonce =
        std::optional<lanebridge::schema::message_nonce_t>{};
    if (lane_messages.lane_state) {
      latest_received_nonce = lane_messages.lane_state->latest_received_nonce;
    }
    if (lane_messages.messages.empty()) {
      if (latest_received_nonce) {
        inbound.receive_state_update(*latest_received_nonce);
      }
      continue;
    }
    auto received =
        inbound.receive_messages(relayer, lane_messages.messages, dispatcher_,
                                 error, latest_received_nonce);
    if (!received) {
      return make_error_result<result_t>(error, kDeliveryCodespace);
    }
    result.events = std::move(received->events);
    result.advance = received->advance;
  }
  return result;
}

lanebridge::schema::confirmation_result_t
engine::receive_messages_delivery_proof(
    const lanebridge::schema::account_id_t& relayer,
    const lanebridge::schema::messages_delivery_proof_t& proof,
    const lanebridge::schema::block_number_t now) {
  using lanebridge::schema::bridge_error_code_t;
  using result_t = lanebridge::schema::confirmation_result_t;

  auto error = bridge_error_code_t::ok;
  auto proved = verifier_.verify_messages_delivery_proof(proof, error);
  if (!proved) {
    spdlog::warn("Delivery proof rejected: {}",
                 lanebridge::schema::to_string(error));
    return make_error_result<result_t>(error, kConfirmationCodespace);
  }
  const auto& [lane, inbound_data] = *proved;

  auto outbound = lanebridge::lane::outbound_lane{encoder_, storage_,
                                                  config_.pallet, lane};
  auto confirmed = outbound.confirm_delivery(
      config_.max_messages_in_confirmation, inbound_data.last_confirmed_nonce,
      inbound_data.relayers, error);
  if (error != bridge_error_code_t::ok) {
    return make_error_result<result_t>(error, kConfirmationCodespace);
  }

  auto result = result_t{};
  result.codespace = std::string{kConfirmationCodespace};
  if (!confirmed) {
    result.log = "no new confirmations";
    return result;
  }
  result.confirmed = confirmed;

  orders_.confirm(lane, *confirmed, now);
  auto settlement = ledger_.slash_and_calculate_rewards(
      lane, inbound_data.relayers, relayer, *confirmed, now);
  ledger_.pay_relayers_rewards(settlement.book, relayer);
  result.rewards = std::move(settlement.rewards);
  result.slashes = std::move(settlement.slashes);

  result.pruned = outbound.prune_messages(
      config_.max_messages_to_prune,
      [this, &lane](const lanebridge::schema::message_nonce_t nonce) {
        return orders_.is_settled(lane, nonce);
      });
  return result;
}

lanebridge::schema::outbound_lane_data_t engine::outbound_lane_data(
    const lanebridge::schema::lane_id_t& lane) const {
  return lanebridge::lane::outbound_lane{encoder_, storage_, config_.pallet,
                                         lane}
      .data();
}

lanebridge::schema::inbound_lane_data_t engine::inbound_lane_data(
    const lanebridge::schema::lane_id_t& lane) const {
  return lanebridge::lane::inbound_lane{encoder_, storage_, config_.pallet, lane,
                                        config_.max_unrewarded_relayers}
      .data();
}

std::optional<lanebridge::schema::message_data_t> engine::outbound_message(
    const lanebridge::schema::lane_id_t& lane,
    const lanebridge::schema::message_nonce_t nonce) const {
  return lanebridge::lane::outbound_lane{encoder_, storage_, config_.pallet,
                                         lane}
      .message(nonce);
}

}  // namespace lanebridge::execution
