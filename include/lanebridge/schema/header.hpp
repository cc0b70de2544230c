#pragma once

#include <lanebridge/schema/primitives.hpp>

#include <compare>

// Schema type: headers seen by the finality collaborators.
namespace lanebridge::schema {

struct header_id final {
  block_number_t number{};
  hash32_t hash{};

  auto operator<=>(const header_id&) const = default;
};

using header_id_t = header_id;

/// Bridged chain header as imported by the header chain and header pool.
struct pool_header final {
  hash32_t parent_hash{};
  block_number_t number{};
  hash32_t state_root{};

  bool operator==(const pool_header&) const = default;
};

using pool_header_t = pool_header;

/// Head of a parachain as committed to by the relay chain.
struct parachain_header final {
  hash32_t parent_hash{};
  block_number_t number{};
  hash32_t state_root{};
  hash32_t extrinsics_root{};

  bool operator==(const parachain_header&) const = default;
};

using parachain_header_t = parachain_header;

}  // namespace lanebridge::schema
