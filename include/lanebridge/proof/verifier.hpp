#pragma once

#include <lanebridge/proof/finality_source.hpp>
#include <lanebridge/schema/bridge_error_code.hpp>
#include <lanebridge/schema/lane_data.hpp>
#include <lanebridge/schema/messages_proof.hpp>
#include <lanebridge/schema/primitives.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace lanebridge::proof {

/// True iff the inclusive range [start, end] holds exactly `count` nonces.
bool messages_count_matches(lanebridge::schema::message_nonce_t start,
                            lanebridge::schema::message_nonce_t end,
                            uint64_t count);

/// Checks storage proofs of the bridged chain's messages pallet against
/// state roots handed out by a finality source.
///
/// Verification is all or nothing: on any defect the result is empty and
/// `error` names the first failed check.
class messages_proof_verifier final {
 public:
  messages_proof_verifier(const finality_source& finality,
                          std::string_view bridged_pallet);

  std::optional<lanebridge::schema::proved_messages_t> verify_messages_proof(
      const lanebridge::schema::messages_proof_t& proof,
      uint64_t messages_count,
      lanebridge::schema::bridge_error_code_t& error) const;

  std::optional<std::pair<lanebridge::schema::lane_id_t,
                          lanebridge::schema::inbound_lane_data_t>>
  verify_messages_delivery_proof(
      const lanebridge::schema::messages_delivery_proof_t& proof,
      lanebridge::schema::bridge_error_code_t& error) const;

 private:
  const finality_source& finality_;
  std::string bridged_pallet_;
};

}  // namespace lanebridge::proof
