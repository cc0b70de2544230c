#pragma once

#include <lanebridge/schema/primitives.hpp>
#include <lanebridge/trie/node.hpp>

#include <map>
#include <optional>
#include <vector>

namespace lanebridge::trie {

/// Read-only view over an untrusted set of trie nodes, anchored at a trusted
/// state root.
class storage_proof_checker final {
 public:
  /// Returns nullopt when the proof does not contain the root node.
  static std::optional<storage_proof_checker> make(
      const lanebridge::schema::hash32_t& root,
      const std::vector<lanebridge::schema::bytes_t>& proof);

  storage_read_t read_value(const lanebridge::schema::bytes_view_t& key) const;

  const lanebridge::schema::hash32_t& root() const { return root_; }

 private:
  storage_proof_checker(
      lanebridge::schema::hash32_t root,
      std::map<lanebridge::schema::hash32_t, lanebridge::schema::bytes_t> nodes);

  lanebridge::schema::hash32_t root_;
  std::map<lanebridge::schema::hash32_t, lanebridge::schema::bytes_t> nodes_;
};

}  // namespace lanebridge::trie
