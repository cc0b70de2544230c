#pragma once

#include <lanebridge/config/bridge_config.hpp>
#include <lanebridge/dispatch/call_runtime.hpp>
#include <lanebridge/dispatch/dispatcher.hpp>
#include <lanebridge/lane/chain_capabilities.hpp>
#include <lanebridge/proof/finality_source.hpp>
#include <lanebridge/proof/verifier.hpp>
#include <lanebridge/reward/currency.hpp>
#include <lanebridge/reward/order_book.hpp>
#include <lanebridge/reward/relayer_registry.hpp>
#include <lanebridge/reward/reward_ledger.hpp>
#include <lanebridge/reward/slasher.hpp>
#include <lanebridge/schema/bridge_result.hpp>
#include <lanebridge/schema/encoding/scale/encoder.hpp>
#include <lanebridge/schema/lane_data.hpp>
#include <lanebridge/schema/message_payload.hpp>
#include <lanebridge/schema/messages_proof.hpp>
#include <lanebridge/schema/primitives.hpp>
#include <lanebridge/storage/rocksdb/storage.hpp>

#include <memory>
#include <optional>

namespace lanebridge::execution {

/// One end of a bridge: sends messages on its outbound lanes, accepts
/// proved deliveries on its inbound lanes and settles relayer rewards when
/// deliveries are confirmed.
///
/// Every call verifies its input before it mutates anything; a result with
/// a non-zero code means nothing was applied.
class engine final {
 public:
  engine(lanebridge::schema::encoding::scale_encoder_t& encoder,
         lanebridge::storage::rocksdb_storage_t& storage,
         lanebridge::config::bridge_config_t config,
         const lanebridge::proof::finality_source& finality,
         lanebridge::dispatch::call_runtime& runtime,
         lanebridge::reward::currency& currency);

  /// Accept a message on `lane`: admission checks, fee payment, nonce and
  /// order creation.
  lanebridge::schema::send_result_t send_message(
      const lanebridge::schema::local_origin_t& submitter,
      const lanebridge::schema::lane_id_t& lane,
      const lanebridge::schema::message_payload_t& payload,
      const lanebridge::schema::amount_t& fee,
      lanebridge::schema::block_number_t now);

  /// Verify a messages proof from the bridged chain and dispatch the range.
  lanebridge::schema::delivery_result_t receive_messages_proof(
      const lanebridge::schema::account_id_t& relayer,
      const lanebridge::schema::messages_proof_t& proof,
      uint64_t messages_count);

  /// Verify a delivery proof, confirm the range, pay relayers and prune.
  lanebridge::schema::confirmation_result_t receive_messages_delivery_proof(
      const lanebridge::schema::account_id_t& relayer,
      const lanebridge::schema::messages_delivery_proof_t& proof,
      lanebridge::schema::block_number_t now);

  lanebridge::schema::outbound_lane_data_t outbound_lane_data(
      const lanebridge::schema::lane_id_t& lane) const;
  lanebridge::schema::inbound_lane_data_t inbound_lane_data(
      const lanebridge::schema::lane_id_t& lane) const;
  std::optional<lanebridge::schema::message_data_t> outbound_message(
      const lanebridge::schema::lane_id_t& lane,
      lanebridge::schema::message_nonce_t nonce) const;

  void set_this_chain_capabilities(
      std::unique_ptr<lanebridge::lane::this_chain_capabilities> capabilities);
  void set_bridged_chain_capabilities(
      std::unique_ptr<lanebridge::lane::bridged_chain_capabilities>
          capabilities);

  lanebridge::dispatch::dispatcher& dispatcher() { return dispatcher_; }
  lanebridge::reward::relayer_registry& registry() { return registry_; }
  const lanebridge::reward::order_book& orders() const { return orders_; }
  const lanebridge::config::bridge_config_t& config() const { return config_; }

 private:
  lanebridge::schema::encoding::scale_encoder_t& encoder_;
  lanebridge::storage::rocksdb_storage_t& storage_;
  lanebridge::config::bridge_config_t config_;
  lanebridge::proof::messages_proof_verifier verifier_;
  lanebridge::dispatch::dispatcher dispatcher_;
  std::unique_ptr<lanebridge::lane::this_chain_capabilities> this_chain_;
  std::unique_ptr<lanebridge::lane::bridged_chain_capabilities> bridged_chain_;
  lanebridge::reward::linear_slasher slasher_;
  lanebridge::reward::order_book orders_;
  lanebridge::reward::relayer_registry registry_;
  lanebridge::reward::reward_ledger ledger_;
};

}  // namespace lanebridge::execution
