#pragma once

#include <lanebridge/schema/primitives.hpp>

#include <optional>
#include <utility>

// Schema type: reward decision for one confirmed message.
namespace lanebridge::schema {

using account_amount_t = std::pair<account_id_t, amount_t>;

struct reward_item final {
  std::optional<account_amount_t> to_slot_relayer;
  std::optional<amount_t> to_treasury;
  std::optional<account_amount_t> to_message_relayer;
  std::optional<account_amount_t> to_confirm_relayer;

  /// Sum of every payout in the item.
  amount_t total() const {
    auto sum = amount_t{0};
    if (to_slot_relayer) {
      sum += to_slot_relayer->second;
    }
    if (to_treasury) {
      sum += *to_treasury;
    }
    if (to_message_relayer) {
      sum += to_message_relayer->second;
    }
    if (to_confirm_relayer) {
      sum += to_confirm_relayer->second;
    }
    return sum;
  }

  bool operator==(const reward_item&) const = default;
};

using reward_item_t = reward_item;

struct order_reward final {
  lane_id_t lane{};
  message_nonce_t nonce{};
  reward_item_t item;
};

using order_reward_t = order_reward;

struct slash_report final {
  lane_id_t lane{};
  message_nonce_t nonce{};
  account_id_t relayer{};
  amount_t requested{};
  /// Amount actually moved; zero when the transfer failed.
  amount_t slashed{};
};

using slash_report_t = slash_report;

}  // namespace lanebridge::schema
