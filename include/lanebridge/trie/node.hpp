#pragma once

#include <lanebridge/schema/primitives.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <variant>
#include <vector>

// Base-16 Merkle trie. Keys are walked nibble by nibble (high nibble first);
// a node is referenced by the blake3 hash of its SCALE encoding.
namespace lanebridge::trie {

using nibbles_t = std::vector<uint8_t>;

nibbles_t to_nibbles(const lanebridge::schema::bytes_view_t& key);

struct leaf_node final {
  nibbles_t partial;
  lanebridge::schema::bytes_t value;
};

struct branch_node final {
  nibbles_t partial;
  std::array<std::optional<lanebridge::schema::hash32_t>, 16> children;
  std::optional<lanebridge::schema::bytes_t> value;
};

using leaf_node_t = leaf_node;
using branch_node_t = branch_node;
using node_t = std::variant<leaf_node_t, branch_node_t>;

void encode(const leaf_node_t& o, ::scale::Encoder& encoder);
void decode(leaf_node_t& o, ::scale::Decoder& decoder);

void encode(const branch_node_t& o, ::scale::Encoder& encoder);
void decode(branch_node_t& o, ::scale::Decoder& decoder);

lanebridge::schema::bytes_t encode_node(const node_t& node);
std::optional<node_t> decode_node(const lanebridge::schema::bytes_view_t& bytes);
lanebridge::schema::hash32_t node_hash(
    const lanebridge::schema::bytes_view_t& encoded);

enum class read_status : uint8_t {
  found = 0,
  /// The proof shows the key has no value.
  absent = 1,
  /// A node needed to answer is not available.
  incomplete = 2
};

using read_status_t = read_status;

struct storage_read final {
  read_status_t status{read_status_t::incomplete};
  lanebridge::schema::bytes_t value;
};

using storage_read_t = storage_read;

using node_lookup_t = std::function<const lanebridge::schema::bytes_t*(
    const lanebridge::schema::hash32_t&)>;

/// Walk from `root` towards `key`. `visit` (optional) sees every encoded node
/// on the path in order.
storage_read_t lookup(
    const node_lookup_t& nodes,
    const lanebridge::schema::hash32_t& root,
    const lanebridge::schema::bytes_view_t& key,
    const std::function<void(const lanebridge::schema::bytes_t&)>& visit = {});

}  // namespace lanebridge::trie
