#include <lanebridge/proof/proof_builder.hpp>
#include <lanebridge/schema/key/storage_keys.hpp>

#include <spdlog/spdlog.h>

namespace lanebridge::proof {

proof_builder::proof_builder(lanebridge::storage::rocksdb_storage_t& storage,
                             const std::string_view pallet)
    : storage_{storage}, pallet_{pallet} {}

lanebridge::trie::trie_builder proof_builder::load() {
  auto trie = lanebridge::trie::trie_builder{};
  const auto prefix = lanebridge::schema::key::pallet_prefix(pallet_);
  for (const auto& [key, value] : storage_.list_by_prefix(prefix)) {
    trie.insert(key, value);
  }
  return trie;
}

lanebridge::schema::hash32_t proof_builder::state_root() {
  return load().root();
}

lanebridge::schema::messages_proof_t proof_builder::messages_proof(
    const lanebridge::schema::hash32_t& header_hash,
    const lanebridge::schema::lane_id_t& lane,
    const lanebridge::schema::message_nonce_t begin,
    const lanebridge::schema::message_nonce_t end,
    const bool include_lane_state) {
  auto keys = std::vector<lanebridge::schema::bytes_t>{};
  if (begin <= end) {
    for (auto nonce = begin;; ++nonce) {
      keys.push_back(
          lanebridge::schema::key::outbound_message_key(pallet_, lane, nonce));
      if (nonce == end) {
        break;
      }
    }
  }
  if (include_lane_state) {
    keys.push_back(
        lanebridge::schema::key::outbound_lane_data_key(pallet_, lane));
  }
  auto trie = load();
  auto proof = lanebridge::schema::messages_proof_t{};
  proof.finalized_header_hash = header_hash;
  proof.storage_proof = trie.generate_proof(keys);
  proof.lane = lane;
  proof.nonces_start = begin;
  proof.nonces_end = end;
  spdlog::debug("Built messages proof [{}, {}] with {} nodes", begin, end,
                proof.storage_proof.size());
  return proof;
}

lanebridge::schema::messages_delivery_proof_t proof_builder::delivery_proof(
    const lanebridge::schema::hash32_t& header_hash,
    const lanebridge::schema::lane_id_t& lane) {
  auto trie = load();
  auto proof = lanebridge::schema::messages_delivery_proof_t{};
  proof.finalized_header_hash = header_hash;
  proof.storage_proof = trie.generate_proof(
      {lanebridge::schema::key::inbound_lane_data_key(pallet_, lane)});
  proof.lane = lane;
  return proof;
}

}  // namespace lanebridge::proof
