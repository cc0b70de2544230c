#include <lanebridge/trie/storage_proof_checker.hpp>

namespace lanebridge::trie {

storage_proof_checker::storage_proof_checker(
    lanebridge::schema::hash32_t root,
    std::map<lanebridge::schema::hash32_t, lanebridge::schema::bytes_t> nodes)
    : root_{root}, nodes_{std::move(nodes)} {}

std::optional<storage_proof_checker> storage_proof_checker::make(
    const lanebridge::schema::hash32_t& root,
    const std::vector<lanebridge::schema::bytes_t>& proof) {
  auto nodes =
      std::map<lanebridge::schema::hash32_t, lanebridge::schema::bytes_t>{};
  for (const auto& encoded : proof) {
    nodes.emplace(node_hash(encoded), encoded);
  }
  if (!nodes.contains(root)) {
    return std::nullopt;
  }
  return storage_proof_checker{root, std::move(nodes)};
}

storage_read_t storage_proof_checker::read_value(
    const lanebridge::schema::bytes_view_t& key) const {
  return lookup(
      [this](const lanebridge::schema::hash32_t& hash)
          -> const lanebridge::schema::bytes_t* {
        auto it = nodes_.find(hash);
        return it == nodes_.end() ? nullptr : &it->second;
      },
      root_, key);
}

}  // namespace lanebridge::trie
