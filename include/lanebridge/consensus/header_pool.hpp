#pragma once

#include <lanebridge/consensus/header_chain.hpp>
#include <lanebridge/schema/bridge_error_code.hpp>
#include <lanebridge/schema/header.hpp>
#include <lanebridge/schema/primitives.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace lanebridge::consensus {

inline constexpr uint64_t kDefaultMaxFutureNumberDifference = 10;

/// Ordering tags of an admitted header: it provides its own (number, hash)
/// and requires its parent's when the parent is not imported yet.
struct pool_validity final {
  std::vector<lanebridge::schema::bytes_t> provides;
  std::vector<lanebridge::schema::bytes_t> required;
};

using pool_validity_t = pool_validity;

/// Admission check for unsigned header submissions.
std::optional<pool_validity_t> accept_into_pool(
    const header_chain& chain,
    uint64_t max_future_number_difference,
    const lanebridge::schema::pool_header_t& header,
    lanebridge::schema::bridge_error_code_t& error);

/// Pending headers waiting for import. Permanently invalid headers are
/// banned; headers too far ahead may be resubmitted later. Entries at or
/// below the finalized number are dropped once finality moves past them.
class header_pool final {
 public:
  header_pool(const header_chain& chain, uint64_t max_future_number_difference);

  std::optional<pool_validity_t> submit(
      const lanebridge::schema::pool_header_t& header,
      lanebridge::schema::bridge_error_code_t& error);

  /// Drops pending headers that were imported or fell behind finality and
  /// bans that finality made moot. Returns the number of entries removed.
  std::size_t prune();

  bool is_banned(const lanebridge::schema::hash32_t& hash) const;
  bool contains(const lanebridge::schema::hash32_t& hash) const;
  std::size_t size() const { return pending_.size(); }

 private:
  struct banned_header final {
    lanebridge::schema::block_number_t number{};
    lanebridge::schema::bridge_error_code_t reason{};
  };

  const header_chain& chain_;
  uint64_t max_future_number_difference_{};
  lanebridge::schema::block_number_t pruned_through_{};
  std::map<lanebridge::schema::hash32_t, lanebridge::schema::pool_header_t>
      pending_;
  std::map<lanebridge::schema::hash32_t, banned_header> banned_;
};

}  // namespace lanebridge::consensus
