#include <lanebridge/blake3/hash.hpp>
#include <lanebridge/consensus/header_chain.hpp>
#include <lanebridge/schema/encoding/scale/encoder.hpp>

#include <spdlog/spdlog.h>

namespace lanebridge::consensus {

lanebridge::schema::hash32_t header_hash(
    const lanebridge::schema::pool_header_t& header) {
  auto encoder = lanebridge::schema::encoding::scale_encoder_t{};
  return lanebridge::blake3::hash(encoder.encode(header));
}

header_chain::header_chain(const lanebridge::schema::pool_header_t& genesis) {
  const auto hash = header_hash(genesis);
  headers_.emplace(hash, genesis);
  final_.insert(hash);
  best_ = lanebridge::schema::header_id_t{genesis.number, hash};
  finalized_ = best_;
}

std::optional<lanebridge::schema::hash32_t> header_chain::import_header(
    const lanebridge::schema::pool_header_t& header) {
  if (!is_known(header.parent_hash)) {
    return std::nullopt;
  }
  const auto hash = header_hash(header);
  headers_.emplace(hash, header);
  if (header.number > best_.number) {
    best_ = lanebridge::schema::header_id_t{header.number, hash};
  }
  spdlog::debug("Imported bridged header #{}", header.number);
  return hash;
}

bool header_chain::finalize(const lanebridge::schema::hash32_t& hash) {
  auto current = header(hash);
  if (!current || current->number < finalized_.number) {
    return false;
  }
  finalized_ = lanebridge::schema::header_id_t{current->number, hash};
  auto cursor = hash;
  while (current && !final_.contains(cursor)) {
    final_.insert(cursor);
    cursor = current->parent_hash;
    current = header(cursor);
  }
  spdlog::info("Finalized bridged header #{}", finalized_.number);
  return true;
}

bool header_chain::is_known(const lanebridge::schema::hash32_t& hash) const {
  return headers_.contains(hash);
}

std::optional<lanebridge::schema::pool_header_t> header_chain::header(
    const lanebridge::schema::hash32_t& hash) const {
  auto it = headers_.find(hash);
  if (it == headers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<lanebridge::schema::hash32_t> header_chain::finalized_state_root(
    const lanebridge::schema::hash32_t& hash) const {
  if (!final_.contains(hash)) {
    return std::nullopt;
  }
  return headers_.at(hash).state_root;
}

}  // namespace lanebridge::consensus
