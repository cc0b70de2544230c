#pragma once

#include <lanebridge/schema/primitives.hpp>
#include <lanebridge/schema/reward_item.hpp>

#include <map>

namespace lanebridge::reward {

/// Running per-recipient sums of one confirmation batch.
struct rewards_book final {
  std::map<lanebridge::schema::account_id_t, lanebridge::schema::amount_t>
      deliver_sum;
  lanebridge::schema::amount_t confirm_sum{};
  std::map<lanebridge::schema::account_id_t, lanebridge::schema::amount_t>
      assigned_relayers_sum;
  lanebridge::schema::amount_t treasury_sum{};

  void add_reward_item(const lanebridge::schema::reward_item_t& item);

  lanebridge::schema::amount_t total() const;
};

using rewards_book_t = rewards_book;

}  // namespace lanebridge::reward
