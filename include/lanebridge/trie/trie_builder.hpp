#pragma once

#include <lanebridge/schema/primitives.hpp>
#include <lanebridge/trie/node.hpp>

#include <map>
#include <vector>

namespace lanebridge::trie {

/// Builds a trie from a full key/value set and hands out storage proofs
/// against its root. The node set is rebuilt lazily after each insert.
class trie_builder final {
 public:
  void insert(const lanebridge::schema::bytes_view_t& key,
              const lanebridge::schema::bytes_view_t& value);

  lanebridge::schema::hash32_t root();

  /// Every node on the path to each of `keys`, deduplicated. Keys that are
  /// absent still contribute the nodes proving their absence.
  std::vector<lanebridge::schema::bytes_t> generate_proof(
      const std::vector<lanebridge::schema::bytes_t>& keys);

  std::size_t size() const { return entries_.size(); }

 private:
  struct entry final {
    nibbles_t path;
    const lanebridge::schema::bytes_t* value{};
  };

  void rebuild();
  lanebridge::schema::hash32_t build(const std::vector<entry>& entries,
                                     std::size_t begin,
                                     std::size_t end,
                                     std::size_t depth);
  lanebridge::schema::hash32_t store(const node_t& node);

  std::map<lanebridge::schema::bytes_t, lanebridge::schema::bytes_t> entries_;
  std::map<lanebridge::schema::hash32_t, lanebridge::schema::bytes_t> nodes_;
  lanebridge::schema::hash32_t root_{};
  bool dirty_{true};
};

}  // namespace lanebridge::trie
