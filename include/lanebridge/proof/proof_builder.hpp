#pragma once

#include <lanebridge/schema/messages_proof.hpp>
#include <lanebridge/schema/primitives.hpp>
#include <lanebridge/storage/rocksdb/storage.hpp>
#include <lanebridge/trie/trie_builder.hpp>

#include <string>
#include <string_view>

namespace lanebridge::proof {

/// Relayer side: computes the state root over every record of one pallet
/// namespace in the store and opens proofs against it.
class proof_builder final {
 public:
  proof_builder(lanebridge::storage::rocksdb_storage_t& storage,
                std::string_view pallet);

  lanebridge::schema::hash32_t state_root();

  lanebridge::schema::messages_proof_t messages_proof(
      const lanebridge::schema::hash32_t& header_hash,
      const lanebridge::schema::lane_id_t& lane,
      lanebridge::schema::message_nonce_t begin,
      lanebridge::schema::message_nonce_t end,
      bool include_lane_state);

  lanebridge::schema::messages_delivery_proof_t delivery_proof(
      const lanebridge::schema::hash32_t& header_hash,
      const lanebridge::schema::lane_id_t& lane);

 private:
  lanebridge::trie::trie_builder load();

  lanebridge::storage::rocksdb_storage_t& storage_;
  std::string pallet_;
};

}  // namespace lanebridge::proof
