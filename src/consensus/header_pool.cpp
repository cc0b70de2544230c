#include <lanebridge/consensus/header_pool.hpp>
#include <lanebridge/schema/encoding/scale/encoder.hpp>

#include <spdlog/spdlog.h>

namespace lanebridge::consensus {

std::optional<pool_validity_t> accept_into_pool(
    const header_chain& chain,
    const uint64_t max_future_number_difference,
    const lanebridge::schema::pool_header_t& header,
    lanebridge::schema::bridge_error_code_t& error) {
  using lanebridge::schema::bridge_error_code_t;

  if (header.number <= chain.finalized().number) {
    error = bridge_error_code_t::ancient_header;
    return std::nullopt;
  }
  const auto hash = header_hash(header);
  if (chain.is_known(hash)) {
    error = bridge_error_code_t::known_header;
    return std::nullopt;
  }
  const auto best = chain.best().number;
  if (header.number > best &&
      header.number - best > max_future_number_difference) {
    error = bridge_error_code_t::too_far_in_future;
    return std::nullopt;
  }

  auto encoder = lanebridge::schema::encoding::scale_encoder_t{};
  auto validity = pool_validity_t{};
  validity.provides.push_back(
      encoder.encode(lanebridge::schema::header_id_t{header.number, hash}));
  if (!chain.is_known(header.parent_hash)) {
    validity.required.push_back(encoder.encode(lanebridge::schema::header_id_t{
        header.number - 1, header.parent_hash}));
  }
  error = bridge_error_code_t::ok;
  return validity;
}

header_pool::header_pool(const header_chain& chain,
                         const uint64_t max_future_number_difference)
    : chain_{chain},
      max_future_number_difference_{max_future_number_difference},
      pruned_through_{chain.finalized().number} {}

std::optional<pool_validity_t> header_pool::submit(
    const lanebridge::schema::pool_header_t& header,
    lanebridge::schema::bridge_error_code_t& error) {
  if (chain_.finalized().number > pruned_through_) {
    prune();
  }
  const auto hash = header_hash(header);
  if (auto it = banned_.find(hash); it != banned_.end()) {
    error = it->second.reason;
    return std::nullopt;
  }
  auto validity =
      accept_into_pool(chain_, max_future_number_difference_, header, error);
  if (!validity) {
    if (!lanebridge::schema::is_transient(error)) {
      banned_.emplace(hash, banned_header{header.number, error});
    }
    spdlog::debug("Header #{} refused: {}", header.number,
                  lanebridge::schema::to_string(error));
    return std::nullopt;
  }
  pending_.insert_or_assign(hash, header);
  return validity;
}

std::size_t header_pool::prune() {
  const auto finalized = chain_.finalized().number;
  auto removed = std::erase_if(pending_, [&](const auto& entry) {
    return entry.second.number <= finalized || chain_.is_known(entry.first);
  });
  removed += std::erase_if(banned_, [&](const auto& entry) {
    return entry.second.number <= finalized;
  });
  pruned_through_ = finalized;
  if (removed > 0) {
    spdlog::debug("Pruned {} pool entries through #{}", removed, finalized);
  }
  return removed;
}

bool header_pool::is_banned(const lanebridge::schema::hash32_t& hash) const {
  return banned_.contains(hash);
}

bool header_pool::contains(const lanebridge::schema::hash32_t& hash) const {
  return pending_.contains(hash);
}

}  // namespace lanebridge::consensus
