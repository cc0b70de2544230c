#pragma once
#include <lanebridge/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace lanebridge::schema::key {

/// Appends key components. Integers are written little-endian, matching
/// their SCALE encoding, so a builder doubles as a preimage writer for
/// account derivation and ownership digests.
struct builder final {
  lanebridge::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  /// Fixed width ids (lanes, chains, accounts) are written raw.
  template <std::size_t N>
  builder& write(const std::array<uint8_t, N>& id) {
    return write(std::span<const uint8_t>{id.data(), id.size()});
  }

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
      data.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
    return *this;
  }

  /// First 16 bytes of the blake3 digest.
  builder& hash128(const std::string_view& str);
  builder& hash128(const std::span<const uint8_t>& bytes);

  /// hash128(bytes) followed by bytes, so map keys stay iterable.
  builder& hash128_concat(const std::span<const uint8_t>& bytes);

  /// blake3 of everything written so far.
  lanebridge::schema::hash32_t digest() const;
};

}  // namespace lanebridge::schema::key
