#include <lanebridge/proof/verifier.hpp>
#include <lanebridge/schema/encoding/scale/encoder.hpp>
#include <lanebridge/schema/key/storage_keys.hpp>
#include <lanebridge/trie/storage_proof_checker.hpp>

#include <limits>
#include <spdlog/spdlog.h>

namespace lanebridge::proof {

namespace {

using encoder_t = lanebridge::schema::encoding::scale_encoder_t;

std::optional<lanebridge::trie::storage_proof_checker> open_proof(
    const finality_source& finality,
    const lanebridge::schema::hash32_t& header_hash,
    const std::vector<lanebridge::schema::bytes_t>& storage_proof,
    lanebridge::schema::bridge_error_code_t& error) {
  auto state_root = finality.finalized_state_root(header_hash);
  if (!state_root) {
    error = lanebridge::schema::bridge_error_code_t::unknown_header;
    return std::nullopt;
  }
  auto checker =
      lanebridge::trie::storage_proof_checker::make(*state_root, storage_proof);
  if (!checker) {
    error = lanebridge::schema::bridge_error_code_t::storage_root_mismatch;
    return std::nullopt;
  }
  return checker;
}

}  // namespace

bool messages_count_matches(const lanebridge::schema::message_nonce_t start,
                            const lanebridge::schema::message_nonce_t end,
                            const uint64_t count) {
  if (end < start) {
    // Only the empty range [n, n - 1] has a size; anything lower is negative.
    return end + 1 == start && count == 0;
  }
  const auto span = end - start;
  if (span == std::numeric_limits<uint64_t>::max()) {
    return false;
  }
  return span + 1 == count;
}

messages_proof_verifier::messages_proof_verifier(
    const finality_source& finality,
    const std::string_view bridged_pallet)
    : finality_{finality}, bridged_pallet_{bridged_pallet} {}

std::optional<lanebridge::schema::proved_messages_t>
messages_proof_verifier::verify_messages_proof(
    const lanebridge::schema::messages_proof_t& proof,
    const uint64_t messages_count,
    lanebridge::schema::bridge_error_code_t& error) const {
  using lanebridge::schema::bridge_error_code_t;

  if (!messages_count_matches(proof.nonces_start, proof.nonces_end,
                              messages_count)) {
    error = bridge_error_code_t::proof_count_mismatch;
    return std::nullopt;
  }

  auto checker = open_proof(finality_, proof.finalized_header_hash,
                            proof.storage_proof, error);
  if (!checker) {
    return std::nullopt;
  }

  auto encoder = encoder_t{};
  auto proved = lanebridge::schema::proved_lane_messages_t{};

  if (messages_count > 0) {
    for (auto nonce = proof.nonces_start;; ++nonce) {
      const auto key = lanebridge::schema::key::outbound_message_key(
          bridged_pallet_, proof.lane, nonce);
      auto read = checker->read_value(key);
      if (read.status != lanebridge::trie::read_status_t::found) {
        spdlog::debug("Messages proof lacks nonce {}", nonce);
        error = bridge_error_code_t::proof_missing_message;
        return std::nullopt;
      }
      auto data = encoder.try_decode<lanebridge::schema::message_data_t>(
          read.value);
      if (!data) {
        error = bridge_error_code_t::proof_decode_failure;
        return std::nullopt;
      }
      proved.messages.push_back(lanebridge::schema::message_t{
          lanebridge::schema::message_key_t{proof.lane, nonce},
          std::move(*data)});
      if (nonce == proof.nonces_end) {
        break;
      }
    }
  }

  const auto lane_key = lanebridge::schema::key::outbound_lane_data_key(
      bridged_pallet_, proof.lane);
  auto lane_read = checker->read_value(lane_key);
  switch (lane_read.status) {
    case lanebridge::trie::read_status_t::found: {
      auto lane_state =
          encoder.try_decode<lanebridge::schema::outbound_lane_data_t>(
              lane_read.value);
      if (!lane_state) {
        error = bridge_error_code_t::proof_decode_failure;
        return std::nullopt;
      }
      proved.lane_state = *lane_state;
      break;
    }
    case lanebridge::trie::read_status_t::incomplete:
    case lanebridge::trie::read_status_t::absent:
      // Lane state is optional; a proof that does not cover it carries none.
      break;
  }

  if (!proved.lane_state && proved.messages.empty()) {
    error = bridge_error_code_t::proof_empty;
    return std::nullopt;
  }

  auto result = lanebridge::schema::proved_messages_t{};
  result.emplace(proof.lane, std::move(proved));
  error = bridge_error_code_t::ok;
  return result;
}

std::optional<std::pair<lanebridge::schema::lane_id_t,
                        lanebridge::schema::inbound_lane_data_t>>
messages_proof_verifier::verify_messages_delivery_proof(
    const lanebridge::schema::messages_delivery_proof_t& proof,
    lanebridge::schema::bridge_error_code_t& error) const {
  using lanebridge::schema::bridge_error_code_t;

  auto checker = open_proof(finality_, proof.finalized_header_hash,
                            proof.storage_proof, error);
  if (!checker) {
    return std::nullopt;
  }

  const auto key =
      lanebridge::schema::key::inbound_lane_data_key(bridged_pallet_, proof.lane);
  auto read = checker->read_value(key);
  if (read.status != lanebridge::trie::read_status_t::found) {
    error = bridge_error_code_t::proof_missing_message;
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto lane_data =
      encoder.try_decode<lanebridge::schema::inbound_lane_data_t>(read.value);
  if (!lane_data) {
    error = bridge_error_code_t::proof_decode_failure;
    return std::nullopt;
  }
  error = bridge_error_code_t::ok;
  return std::make_pair(proof.lane, std::move(*lane_data));
}

}  // namespace lanebridge::proof
