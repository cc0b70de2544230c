#include <lanebridge/reward/rewards_book.hpp>

namespace lanebridge::reward {

void rewards_book::add_reward_item(const lanebridge::schema::reward_item_t& item) {
  if (item.to_slot_relayer) {
    assigned_relayers_sum[item.to_slot_relayer->first] +=
        item.to_slot_relayer->second;
  }
  if (item.to_treasury) {
    treasury_sum += *item.to_treasury;
  }
  if (item.to_message_relayer) {
    deliver_sum[item.to_message_relayer->first] +=
        item.to_message_relayer->second;
  }
  if (item.to_confirm_relayer) {
    confirm_sum += item.to_confirm_relayer->second;
  }
}

lanebridge::schema::amount_t rewards_book::total() const {
  auto sum = confirm_sum + treasury_sum;
  for (const auto& [_, amount] : deliver_sum) {
    sum += amount;
  }
  for (const auto& [_, amount] : assigned_relayers_sum) {
    sum += amount;
  }
  return sum;
}

}  // namespace lanebridge::reward
