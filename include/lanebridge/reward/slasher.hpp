#pragma once

#include <lanebridge/schema/primitives.hpp>

namespace lanebridge::reward {

/// Penalty for an order confirmed `delay` blocks after its last deadline.
class slasher {
 public:
  virtual ~slasher() = default;

  virtual lanebridge::schema::amount_t slash_amount(
      const lanebridge::schema::amount_t& locked_collateral,
      lanebridge::schema::block_number_t delay) const = 0;
};

/// `min(locked_collateral, delay * per_block)`.
class linear_slasher final : public slasher {
 public:
  explicit linear_slasher(lanebridge::schema::amount_t per_block);

  lanebridge::schema::amount_t slash_amount(
      const lanebridge::schema::amount_t& locked_collateral,
      lanebridge::schema::block_number_t delay) const override;

 private:
  lanebridge::schema::amount_t per_block_;
};

}  // namespace lanebridge::reward
