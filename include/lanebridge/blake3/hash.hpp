#pragma once
#include <lanebridge/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <span>
#include <string_view>

// Every hash in the bridge is blake3: trie node references, header hashes,
// parachain heads, storage key prefixes and derived accounts.
namespace lanebridge::blake3 {

using hash128_t = std::array<uint8_t, 16>;

lanebridge::schema::hash32_t hash(const std::string_view& str);
lanebridge::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

/// Leading 16 bytes of the digest; used for storage key prefixes.
hash128_t hash128(const std::string_view& str);
hash128_t hash128(const std::span<const uint8_t>& bytes);

}  // namespace lanebridge::blake3
