#include <lanebridge/lane/chain_capabilities.hpp>

#include <variant>

namespace lanebridge::lane {

uint32_t maximal_message_size(const uint32_t max_extrinsic_size) {
  return max_extrinsic_size / 3 * 2;
}

configured_this_chain::configured_this_chain(
    std::set<lanebridge::schema::lane_id_t> lanes,
    const uint64_t max_pending)
    : lanes_{std::move(lanes)}, max_pending_{max_pending} {}

bool configured_this_chain::accepts(
    const lanebridge::schema::local_origin_t& submitter,
    const lanebridge::schema::lane_id_t& lane) const {
  if (std::holds_alternative<lanebridge::schema::none_origin_t>(submitter)) {
    return false;
  }
  return lanes_.empty() || lanes_.contains(lane);
}

configured_bridged_chain::configured_bridged_chain(
    const uint32_t max_extrinsic_size,
    const lanebridge::schema::weight_t max_extrinsic_weight)
    : max_extrinsic_size_{max_extrinsic_size},
      max_extrinsic_weight_{max_extrinsic_weight} {}

bool configured_bridged_chain::verify_dispatch_weight(
    const lanebridge::schema::bytes_view_t&,
    const lanebridge::schema::weight_t& weight) const {
  return weight.ref_time() <= max_extrinsic_weight_.ref_time() / 2;
}

}  // namespace lanebridge::lane
