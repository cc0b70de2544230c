#include <lanebridge/blake3/hash.hpp>
#include <lanebridge/proof/parachain_anchor.hpp>
#include <lanebridge/schema/encoding/scale/encoder.hpp>
#include <lanebridge/schema/key/storage_keys.hpp>
#include <lanebridge/trie/storage_proof_checker.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace lanebridge::proof {

parachain_anchor::parachain_anchor(const finality_source& relay_finality,
                                   const uint32_t para_id,
                                   const uint32_t heads_to_keep)
    : relay_finality_{relay_finality},
      para_id_{para_id},
      heads_to_keep_{std::max(heads_to_keep, 1u)} {}

std::optional<lanebridge::schema::hash32_t> parachain_anchor::import_head(
    const lanebridge::schema::hash32_t& relay_header_hash,
    const std::vector<lanebridge::schema::bytes_t>& storage_proof,
    lanebridge::schema::bridge_error_code_t& error) {
  using lanebridge::schema::bridge_error_code_t;

  auto relay_root = relay_finality_.finalized_state_root(relay_header_hash);
  if (!relay_root) {
    error = bridge_error_code_t::unknown_header;
    return std::nullopt;
  }
  auto checker =
      lanebridge::trie::storage_proof_checker::make(*relay_root, storage_proof);
  if (!checker) {
    error = bridge_error_code_t::storage_root_mismatch;
    return std::nullopt;
  }
  auto read =
      checker->read_value(lanebridge::schema::key::parachain_head_key(para_id_));
  if (read.status != lanebridge::trie::read_status_t::found) {
    error = bridge_error_code_t::proof_missing_message;
    return std::nullopt;
  }

  auto encoder = lanebridge::schema::encoding::scale_encoder_t{};
  auto header =
      encoder.try_decode<lanebridge::schema::parachain_header_t>(read.value);
  if (!header) {
    error = bridge_error_code_t::proof_decode_failure;
    return std::nullopt;
  }

  auto hash = lanebridge::blake3::hash(read.value);
  spdlog::info("Imported parachain {} head #{}", para_id_, header->number);
  if (heads_.insert_or_assign(hash, *header).second) {
    imported_.push_back(hash);
  }
  while (imported_.size() > heads_to_keep_) {
    heads_.erase(imported_.front());
    imported_.pop_front();
  }
  error = bridge_error_code_t::ok;
  return hash;
}

std::optional<lanebridge::schema::hash32_t>
parachain_anchor::finalized_state_root(
    const lanebridge::schema::hash32_t& header_hash) const {
  auto it = heads_.find(header_hash);
  if (it == heads_.end()) {
    return std::nullopt;
  }
  return it->second.state_root;
}

lanebridge::schema::hash32_t parachain_head_hash(
    const lanebridge::schema::parachain_header_t& header) {
  auto encoder = lanebridge::schema::encoding::scale_encoder_t{};
  return lanebridge::blake3::hash(encoder.encode(header));
}

}  // namespace lanebridge::proof
