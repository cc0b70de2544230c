#include <lanebridge/blake3/hash.hpp>
#include <lanebridge/schema/encoding/scale/encoder.hpp>
#include <lanebridge/trie/node.hpp>

#include <algorithm>
#include <scale/scale.hpp>
#include <stdexcept>

namespace lanebridge::trie {

namespace {

using encoder_t = lanebridge::schema::encoding::scale_encoder_t;

void check_nibbles(const nibbles_t& nibbles) {
  if (std::ranges::any_of(nibbles, [](const uint8_t n) { return n > 0x0F; })) {
    throw std::invalid_argument{"trie node partial key is not a nibble path"};
  }
}

bool starts_with(const nibbles_t& key,
                 const std::size_t offset,
                 const nibbles_t& partial) {
  if (key.size() - offset < partial.size()) {
    return false;
  }
  return std::equal(partial.begin(), partial.end(), key.begin() + offset);
}

}  // namespace

nibbles_t to_nibbles(const lanebridge::schema::bytes_view_t& key) {
  auto out = nibbles_t{};
  out.reserve(key.size() * 2);
  for (const auto byte : key) {
    out.push_back(static_cast<uint8_t>(byte >> 4u));
    out.push_back(static_cast<uint8_t>(byte & 0x0Fu));
  }
  return out;
}

void encode(const leaf_node_t& o, ::scale::Encoder& encoder) {
  encode(o.partial, encoder);
  encode(o.value, encoder);
}

void decode(leaf_node_t& o, ::scale::Decoder& decoder) {
  decode(o.partial, decoder);
  check_nibbles(o.partial);
  decode(o.value, decoder);
}

void encode(const branch_node_t& o, ::scale::Encoder& encoder) {
  encode(o.partial, encoder);
  encode(o.children, encoder);
  encode(o.value, encoder);
}

void decode(branch_node_t& o, ::scale::Decoder& decoder) {
  decode(o.partial, decoder);
  check_nibbles(o.partial);
  decode(o.children, decoder);
  decode(o.value, decoder);
}

lanebridge::schema::bytes_t encode_node(const node_t& node) {
  auto encoder = encoder_t{};
  return encoder.encode(node);
}

std::optional<node_t> decode_node(const lanebridge::schema::bytes_view_t& bytes) {
  auto encoder = encoder_t{};
  return encoder.try_decode<node_t>(bytes);
}

lanebridge::schema::hash32_t node_hash(
    const lanebridge::schema::bytes_view_t& encoded) {
  return lanebridge::blake3::hash(encoded);
}

storage_read_t lookup(
    const node_lookup_t& nodes,
    const lanebridge::schema::hash32_t& root,
    const lanebridge::schema::bytes_view_t& key,
    const std::function<void(const lanebridge::schema::bytes_t&)>& visit) {
  const auto path = to_nibbles(key);
  auto depth = std::size_t{0};
  auto current = root;

  while (true) {
    const auto* encoded = nodes(current);
    if (encoded == nullptr) {
      return storage_read_t{read_status_t::incomplete, {}};
    }
    if (visit) {
      visit(*encoded);
    }
    auto node = decode_node(*encoded);
    if (!node) {
      return storage_read_t{read_status_t::incomplete, {}};
    }

    if (const auto* leaf = std::get_if<leaf_node_t>(&*node)) {
      if (path.size() - depth == leaf->partial.size() &&
          starts_with(path, depth, leaf->partial)) {
        return storage_read_t{read_status_t::found, leaf->value};
      }
      return storage_read_t{read_status_t::absent, {}};
    }

    const auto& branch = std::get<branch_node_t>(*node);
    if (!starts_with(path, depth, branch.partial)) {
      return storage_read_t{read_status_t::absent, {}};
    }
    depth += branch.partial.size();
    if (depth == path.size()) {
      if (branch.value) {
        return storage_read_t{read_status_t::found, *branch.value};
      }
      return storage_read_t{read_status_t::absent, {}};
    }
    const auto& child = branch.children[path[depth]];
    if (!child) {
      return storage_read_t{read_status_t::absent, {}};
    }
    current = *child;
    ++depth;
  }
}

}  // namespace lanebridge::trie
