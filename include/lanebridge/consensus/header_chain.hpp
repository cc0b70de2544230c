#pragma once

#include <lanebridge/proof/finality_source.hpp>
#include <lanebridge/schema/header.hpp>
#include <lanebridge/schema/primitives.hpp>

#include <map>
#include <optional>
#include <set>

namespace lanebridge::consensus {

lanebridge::schema::hash32_t header_hash(
    const lanebridge::schema::pool_header_t& header);

/// In-memory registry of bridged chain headers. Finality is decided
/// elsewhere and reported through `finalize`.
class header_chain final : public lanebridge::proof::finality_source {
 public:
  /// The genesis header is known and final.
  explicit header_chain(const lanebridge::schema::pool_header_t& genesis);

  /// Returns nullopt when the parent is unknown.
  std::optional<lanebridge::schema::hash32_t> import_header(
      const lanebridge::schema::pool_header_t& header);

  /// Mark `hash` and all its ancestors final. Fails for unknown headers
  /// and for headers below the current finalized number.
  bool finalize(const lanebridge::schema::hash32_t& hash);

  bool is_known(const lanebridge::schema::hash32_t& hash) const;

  std::optional<lanebridge::schema::pool_header_t> header(
      const lanebridge::schema::hash32_t& hash) const;

  const lanebridge::schema::header_id_t& best() const { return best_; }
  const lanebridge::schema::header_id_t& finalized() const {
    return finalized_;
  }

  std::optional<lanebridge::schema::hash32_t> finalized_state_root(
      const lanebridge::schema::hash32_t& header_hash) const override;

 private:
  std::map<lanebridge::schema::hash32_t, lanebridge::schema::pool_header_t>
      headers_;
  std::set<lanebridge::schema::hash32_t> final_;
  lanebridge::schema::header_id_t best_;
  lanebridge::schema::header_id_t finalized_;
};

}  // namespace lanebridge::consensus
