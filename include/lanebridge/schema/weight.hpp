#pragma once

#include <compare>
#include <cstdint>
#include <limits>

namespace lanebridge::schema {

/// Execution cost on a single chain.
///
/// Kept opaque so that costs of the two bridged chains are never mixed with
/// plain integers (nonces, sizes) by accident. Arithmetic saturates.
class weight final {
 public:
  constexpr weight() = default;
  constexpr explicit weight(const uint64_t ref_time) : ref_time_{ref_time} {}

  static constexpr weight zero() { return weight{}; }
  static constexpr weight max() {
    return weight{std::numeric_limits<uint64_t>::max()};
  }

  constexpr uint64_t ref_time() const { return ref_time_; }
  constexpr bool is_zero() const { return ref_time_ == 0; }

  constexpr weight saturating_add(const weight& other) const {
    if (ref_time_ > std::numeric_limits<uint64_t>::max() - other.ref_time_) {
      return max();
    }
    return weight{ref_time_ + other.ref_time_};
  }

  constexpr weight saturating_sub(const weight& other) const {
    if (other.ref_time_ >= ref_time_) {
      return zero();
    }
    return weight{ref_time_ - other.ref_time_};
  }

  constexpr weight operator+(const weight& other) const {
    return saturating_add(other);
  }

  constexpr weight& operator+=(const weight& other) {
    *this = saturating_add(other);
    return *this;
  }

  constexpr auto operator<=>(const weight&) const = default;

 private:
  uint64_t ref_time_{};
};

using weight_t = weight;

}  // namespace lanebridge::schema
