#include <lanebridge/reward/slasher.hpp>

#include <algorithm>

namespace lanebridge::reward {

linear_slasher::linear_slasher(lanebridge::schema::amount_t per_block)
    : per_block_{std::move(per_block)} {}

lanebridge::schema::amount_t linear_slasher::slash_amount(
    const lanebridge::schema::amount_t& locked_collateral,
    const lanebridge::schema::block_number_t delay) const {
  const auto penalty = lanebridge::schema::amount_t{per_block_ * delay};
  return std::min(locked_collateral, penalty);
}

}  // namespace lanebridge::reward
