#pragma once

#include <lanebridge/schema/primitives.hpp>

#include <optional>

namespace lanebridge::proof {

/// Root of trust for storage proofs. Implementations answer only for
/// headers they consider final.
class finality_source {
 public:
  virtual ~finality_source() = default;

  virtual std::optional<lanebridge::schema::hash32_t> finalized_state_root(
      const lanebridge::schema::hash32_t& header_hash) const = 0;
};

}  // namespace lanebridge::proof
