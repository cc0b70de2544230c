#include <lanebridge/trie/trie_builder.hpp>

#include <algorithm>
#include <set>

namespace lanebridge::trie {

void trie_builder::insert(const lanebridge::schema::bytes_view_t& key,
                          const lanebridge::schema::bytes_view_t& value) {
  entries_[lanebridge::schema::make_bytes(key)] =
      lanebridge::schema::make_bytes(value);
  dirty_ = true;
}

lanebridge::schema::hash32_t trie_builder::root() {
  rebuild();
  return root_;
}

std::vector<lanebridge::schema::bytes_t> trie_builder::generate_proof(
    const std::vector<lanebridge::schema::bytes_t>& keys) {
  rebuild();
  auto proof = std::vector<lanebridge::schema::bytes_t>{};
  auto seen = std::set<lanebridge::schema::hash32_t>{};
  const auto nodes = [this](const lanebridge::schema::hash32_t& hash)
      -> const lanebridge::schema::bytes_t* {
    auto it = nodes_.find(hash);
    return it == nodes_.end() ? nullptr : &it->second;
  };
  for (const auto& key : keys) {
    lookup(nodes, root_, key, [&](const lanebridge::schema::bytes_t& encoded) {
      if (seen.insert(node_hash(encoded)).second) {
        proof.push_back(encoded);
      }
    });
  }
  return proof;
}

void trie_builder::rebuild() {
  if (!dirty_) {
    return;
  }
  nodes_.clear();
  if (entries_.empty()) {
    root_ = store(branch_node_t{});
  } else {
    auto sorted = std::vector<entry>{};
    sorted.reserve(entries_.size());
    for (const auto& [key, value] : entries_) {
      sorted.push_back(entry{to_nibbles(key), &value});
    }
    root_ = build(sorted, 0, sorted.size(), 0);
  }
  dirty_ = false;
}

// `entries` is ordered by key, so a key that is a prefix of its neighbours
// always comes first in its range.
lanebridge::schema::hash32_t trie_builder::build(
    const std::vector<entry>& entries,
    const std::size_t begin,
    const std::size_t end,
    const std::size_t depth) {
  const auto& first = entries[begin].path;
  if (end - begin == 1) {
    return store(leaf_node_t{nibbles_t{first.begin() + depth, first.end()},
                             *entries[begin].value});
  }

  auto common = first.size() - depth;
  const auto& last = entries[end - 1].path;
  auto shared = std::size_t{0};
  while (shared < common && depth + shared < last.size() &&
         first[depth + shared] == last[depth + shared]) {
    ++shared;
  }
  common = shared;
  const auto split = depth + common;

  auto branch = branch_node_t{};
  branch.partial = nibbles_t{first.begin() + depth, first.begin() + split};
  auto index = begin;
  if (first.size() == split) {
    branch.value = *entries[begin].value;
    ++index;
  }
  while (index < end) {
    const auto nibble = entries[index].path[split];
    auto group_end = index + 1;
    while (group_end < end && entries[group_end].path[split] == nibble) {
      ++group_end;
    }
    branch.children[nibble] = build(entries, index, group_end, split + 1);
    index = group_end;
  }
  return store(branch);
}

lanebridge::schema::hash32_t trie_builder::store(const node_t& node) {
  auto encoded = encode_node(node);
  auto hash = node_hash(encoded);
  nodes_.emplace(hash, std::move(encoded));
  return hash;
}

}  // namespace lanebridge::trie
