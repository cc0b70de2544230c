#pragma once

#include <lanebridge/schema/message_payload.hpp>
#include <lanebridge/schema/primitives.hpp>
#include <lanebridge/schema/weight.hpp>

#include <cstdint>
#include <set>

namespace lanebridge::lane {

/// What this chain allows on its outbound lanes.
class this_chain_capabilities {
 public:
  virtual ~this_chain_capabilities() = default;

  virtual bool accepts(const lanebridge::schema::local_origin_t& submitter,
                       const lanebridge::schema::lane_id_t& lane) const = 0;
  virtual uint64_t max_pending() const = 0;
};

/// Limits of the chain that will execute our messages.
class bridged_chain_capabilities {
 public:
  virtual ~bridged_chain_capabilities() = default;

  virtual uint32_t max_extrinsic_size() const = 0;
  virtual bool verify_dispatch_weight(
      const lanebridge::schema::bytes_view_t& payload,
      const lanebridge::schema::weight_t& weight) const = 0;
};

/// Largest encoded payload that still fits a delivery transaction next to
/// its proof.
uint32_t maximal_message_size(uint32_t max_extrinsic_size);

class configured_this_chain final : public this_chain_capabilities {
 public:
  /// An empty lane set accepts every lane.
  configured_this_chain(std::set<lanebridge::schema::lane_id_t> lanes,
                        uint64_t max_pending);

  bool accepts(const lanebridge::schema::local_origin_t& submitter,
               const lanebridge::schema::lane_id_t& lane) const override;
  uint64_t max_pending() const override { return max_pending_; }

 private:
  std::set<lanebridge::schema::lane_id_t> lanes_;
  uint64_t max_pending_{};
};

class configured_bridged_chain final : public bridged_chain_capabilities {
 public:
  configured_bridged_chain(uint32_t max_extrinsic_size,
                           lanebridge::schema::weight_t max_extrinsic_weight);

  uint32_t max_extrinsic_size() const override { return max_extrinsic_size_; }

  /// A single message may use at most half of a block's extrinsic weight.
  bool verify_dispatch_weight(
      const lanebridge::schema::bytes_view_t& payload,
      const lanebridge::schema::weight_t& weight) const override;

 private:
  uint32_t max_extrinsic_size_{};
  lanebridge::schema::weight_t max_extrinsic_weight_;
};

}  // namespace lanebridge::lane
