#pragma once

#include <lanebridge/proof/finality_source.hpp>
#include <lanebridge/schema/bridge_error_code.hpp>
#include <lanebridge/schema/header.hpp>
#include <lanebridge/schema/primitives.hpp>

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <vector>

namespace lanebridge::proof {

inline constexpr uint32_t kDefaultHeadsToKeep = 1'024;

/// Finality for a parachain whose heads are committed to by a relay chain.
///
/// A head is accepted once a relay-chain storage proof of `Paras/Heads` at a
/// finalized relay header opens it. From then on the parachain header's
/// state root is served exactly like a directly finalized one. Only the
/// `heads_to_keep` most recently imported heads are retained.
class parachain_anchor final : public finality_source {
 public:
  parachain_anchor(const finality_source& relay_finality,
                   uint32_t para_id,
                   uint32_t heads_to_keep = kDefaultHeadsToKeep);

  /// Verify and import the head of `para_id` at `relay_header_hash`.
  /// Returns the parachain header hash on success.
  std::optional<lanebridge::schema::hash32_t> import_head(
      const lanebridge::schema::hash32_t& relay_header_hash,
      const std::vector<lanebridge::schema::bytes_t>& storage_proof,
      lanebridge::schema::bridge_error_code_t& error);

  std::optional<lanebridge::schema::hash32_t> finalized_state_root(
      const lanebridge::schema::hash32_t& header_hash) const override;

  uint32_t para_id() const { return para_id_; }
  std::size_t size() const { return heads_.size(); }

 private:
  const finality_source& relay_finality_;
  uint32_t para_id_{};
  uint32_t heads_to_keep_{};
  std::map<lanebridge::schema::hash32_t, lanebridge::schema::parachain_header_t>
      heads_;
  // Import order, oldest first.
  std::deque<lanebridge::schema::hash32_t> imported_;
};

/// Hash under which a parachain head is known: blake3 of the head bytes.
lanebridge::schema::hash32_t parachain_head_hash(
    const lanebridge::schema::parachain_header_t& header);

}  // namespace lanebridge::proof
