#include <blake3.h>
#include <lanebridge/blake3/hash.hpp>

#include <algorithm>

namespace lanebridge::blake3 {

namespace {

static_assert(BLAKE3_OUT_LEN ==
              std::tuple_size_v<lanebridge::schema::hash32_t>);

template <typename Output>
Output digest(const void* data, const std::size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = Output{};
  // blake3 is an XOF; a shorter output is a prefix of the full digest.
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

lanebridge::schema::hash32_t hash(const std::string_view& str) {
  return digest<lanebridge::schema::hash32_t>(str.data(), str.size());
}

lanebridge::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  return digest<lanebridge::schema::hash32_t>(bytes.data(), bytes.size());
}

hash128_t hash128(const std::string_view& str) {
  return digest<hash128_t>(str.data(), str.size());
}

hash128_t hash128(const std::span<const uint8_t>& bytes) {
  return digest<hash128_t>(bytes.data(), bytes.size());
}

}  // namespace lanebridge::blake3
