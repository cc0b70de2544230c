#pragma once

#include <lanebridge/schema/primitives.hpp>

#include <algorithm>
#include <cstdint>

namespace lanebridge::schema {

/// Ratio in parts per million. Applying it to an amount rounds down.
struct permill final {
  static constexpr uint32_t kOne = 1'000'000;

  uint32_t parts{};

  static constexpr permill from_percent(const uint32_t percent) {
    return permill{std::min(percent, 100u) * 10'000u};
  }

  static constexpr permill one() { return permill{kOne}; }

  /// Splits `amount` at kOne first so the product never exceeds its width.
  amount_t apply(const amount_t& amount) const {
    return amount / kOne * parts + amount % kOne * parts / kOne;
  }

  constexpr auto operator<=>(const permill&) const = default;
};

using permill_t = permill;

}  // namespace lanebridge::schema
