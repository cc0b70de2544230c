#include <lanebridge/blake3/hash.hpp>
#include <lanebridge/schema/key/builder.hpp>

namespace lanebridge::schema::key {

builder& builder::write(const std::string_view& str) {
  data.insert(data.end(), str.begin(), str.end());
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  data.insert(data.end(), bytes.begin(), bytes.end());
  return *this;
}

builder& builder::hash128(const std::string_view& str) {
  const auto prefix = lanebridge::blake3::hash128(str);
  data.insert(data.end(), prefix.begin(), prefix.end());
  return *this;
}

builder& builder::hash128(const std::span<const uint8_t>& bytes) {
  const auto prefix = lanebridge::blake3::hash128(bytes);
  data.insert(data.end(), prefix.begin(), prefix.end());
  return *this;
}

builder& builder::hash128_concat(const std::span<const uint8_t>& bytes) {
  return hash128(bytes).write(bytes);
}

lanebridge::schema::hash32_t builder::digest() const {
  return lanebridge::blake3::hash(data);
}

}  // namespace lanebridge::schema::key
