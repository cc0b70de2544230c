#include <lanebridge/reward/reward_ledger.hpp>
#include <lanebridge/schema/bridge_error_code.hpp>

#include <algorithm>
#include <spdlog/spdlog.h>
#include <variant>

namespace lanebridge::reward {

reward_ledger::reward_ledger(reward_settings_t settings,
                             currency& currency,
                             const slasher& slasher,
                             relayer_registry& registry,
                             order_book& orders)
    : settings_{std::move(settings)},
      currency_{currency},
      slasher_{slasher},
      registry_{registry},
      orders_{orders} {}

bool reward_ledger::pay_delivery_and_dispatch_fee(
    const lanebridge::schema::local_origin_t& submitter,
    const lanebridge::schema::amount_t& fee) {
  const auto* signed_submitter =
      std::get_if<lanebridge::schema::signed_origin_t>(&submitter);
  if (signed_submitter == nullptr) {
    if (fee != 0) {
      spdlog::warn("Non-zero message fee can't be paid without an account");
      return false;
    }
    return true;
  }
  return currency_.transfer(signed_submitter->account, settings_.fund_account,
                            fee);
}

settlement_t reward_ledger::slash_and_calculate_rewards(
    const lanebridge::schema::lane_id_t& lane,
    const std::vector<lanebridge::schema::unrewarded_relayer_t>&
        messages_relayers,
    const lanebridge::schema::account_id_t& confirm_relayer,
    const lanebridge::schema::delivered_messages_t& received_range,
    const lanebridge::schema::block_number_t now) {
  auto result = settlement_t{};
  for (const auto& entry : messages_relayers) {
    const auto nonce_begin =
        std::max(entry.messages.begin, received_range.begin);
    const auto nonce_end = std::min(entry.messages.end, received_range.end);
    if (nonce_begin > nonce_end) {
      continue;
    }

    for (auto nonce = nonce_begin;; ++nonce) {
      auto order = orders_.order(lane, nonce);
      if (!order) {
        spdlog::warn("Confirmed message {} has no order", nonce);
      } else {
        const auto confirm_time = order->confirm_time.value_or(now);
        auto total_reward = order->fee;
        auto item = lanebridge::schema::reward_item_t{};
        const auto slashed_before = result.slashes.size();

        const auto slot = lanebridge::schema::delivery_slot(*order, confirm_time);
        if (slot) {
          // Every assignee whose slot passed before delivery is slashed.
          for (std::size_t index = 0; index < *slot; ++index) {
            const auto& lazy = order->relayers[index].id;
            total_reward += slash_assigned_relayer(
                *order, lazy,
                settings_.assigned_relayer_slash_ratio.apply(
                    registry_.locked_collateral(lazy)),
                result.slashes);
          }
          const auto base_fee = settings_.base_fee_ratio.apply(order->fee);
          rewards_before_deadline(order->relayers[*slot].id, entry.relayer,
                                  confirm_relayer, total_reward, base_fee,
                                  item);
        } else {
          const auto delay =
              lanebridge::schema::delivery_delay(*order, confirm_time);
          for (const auto& assigned : order->relayers) {
            auto amount =
                slasher_.slash_amount(order->locked_collateral, delay) +
                settings_.assigned_relayer_slash_ratio.apply(
                    registry_.locked_collateral(assigned.id));
            if (settings_.collateral_slash_protect) {
              amount = std::min(amount, *settings_.collateral_slash_protect);
            }
            total_reward += slash_assigned_relayer(*order, assigned.id, amount,
                                                   result.slashes);
          }
          rewards_after_deadline(entry.relayer, confirm_relayer, total_reward,
                                 item);
        }

        result.total_fees += order->fee;
        for (auto i = slashed_before; i < result.slashes.size(); ++i) {
          result.total_slashed += result.slashes[i].slashed;
        }
        spdlog::info("Order {} rewarded {} in total", nonce,
                     item.total().str());
        result.book.add_reward_item(item);
        result.rewards.push_back(
            lanebridge::schema::order_reward_t{lane, nonce, std::move(item)});
        orders_.settle(lane, nonce);
      }
      if (nonce == nonce_end) {
        break;
      }
    }
  }
  return result;
}

void reward_ledger::rewards_before_deadline(
    const lanebridge::schema::account_id_t& slot_relayer,
    const lanebridge::schema::account_id_t& message_relayer,
    const lanebridge::schema::account_id_t& confirm_relayer,
    const lanebridge::schema::amount_t& total_reward,
    const lanebridge::schema::amount_t& base_fee,
    lanebridge::schema::reward_item_t& item) const {
  const auto relayers_share = std::min(base_fee, total_reward);
  item.to_treasury = total_reward - relayers_share;

  const auto slot_reward =
      settings_.assigned_relayers_reward_ratio.apply(relayers_share);
  item.to_slot_relayer =
      lanebridge::schema::account_amount_t{slot_relayer, slot_reward};

  const auto bridgers_reward = relayers_share - slot_reward;
  const auto message_reward =
      settings_.message_relayers_reward_ratio.apply(bridgers_reward);
  item.to_message_relayer =
      lanebridge::schema::account_amount_t{message_relayer, message_reward};
  item.to_confirm_relayer = lanebridge::schema::account_amount_t{
      confirm_relayer, bridgers_reward - message_reward};
}

void reward_ledger::rewards_after_deadline(
    const lanebridge::schema::account_id_t& message_relayer,
    const lanebridge::schema::account_id_t& confirm_relayer,
    const lanebridge::schema::amount_t& total_reward,
    lanebridge::schema::reward_item_t& item) const {
  const auto message_reward =
      settings_.message_relayers_reward_ratio.apply(total_reward);
  item.to_message_relayer =
      lanebridge::schema::account_amount_t{message_relayer, message_reward};
  item.to_confirm_relayer = lanebridge::schema::account_amount_t{
      confirm_relayer, total_reward - message_reward};
}

lanebridge::schema::amount_t reward_ledger::slash_assigned_relayer(
    const lanebridge::schema::order_t& order,
    const lanebridge::schema::account_id_t& who,
    const lanebridge::schema::amount_t& amount,
    std::vector<lanebridge::schema::slash_report_t>& reports) {
  const auto locked_collateral = registry_.locked_collateral(who);
  auto report = lanebridge::schema::slash_report_t{};
  report.lane = order.lane;
  report.nonce = order.nonce;
  report.relayer = who;
  report.requested = std::min(amount, locked_collateral);

  if (report.requested == 0) {
    reports.push_back(report);
    return 0;
  }
  // The slash is taken out of the locked collateral itself; the lock is put
  // back at whatever collateral remains.
  currency_.remove_lock(who);
  if (!currency_.transfer(who, settings_.fund_account, report.requested)) {
    registry_.set_locked_collateral(who, locked_collateral);
    spdlog::error("{}: relayer {} amount {}",
                  lanebridge::schema::to_string(
                      lanebridge::schema::bridge_error_code_t::
                          slash_transfer_failed),
                  lanebridge::schema::to_hex(who), report.requested.str());
    reports.push_back(report);
    return 0;
  }

  registry_.set_locked_collateral(who, locked_collateral - report.requested);
  report.slashed = report.requested;
  spdlog::debug("Slashed relayer {} by {}", lanebridge::schema::to_hex(who),
                report.slashed.str());
  reports.push_back(report);
  return report.slashed;
}

void reward_ledger::pay_relayers_rewards(
    const rewards_book_t& book,
    const lanebridge::schema::account_id_t& confirm_relayer) {
  do_reward(confirm_relayer, book.confirm_sum);
  for (const auto& [relayer, reward] : book.deliver_sum) {
    do_reward(relayer, reward);
  }
  for (const auto& [relayer, reward] : book.assigned_relayers_sum) {
    do_reward(relayer, reward);
  }
  do_reward(settings_.treasury_account, book.treasury_sum);
}

void reward_ledger::do_reward(const lanebridge::schema::account_id_t& to,
                              const lanebridge::schema::amount_t& reward) {
  if (reward == 0) {
    return;
  }
  if (!currency_.transfer(settings_.fund_account, to, reward)) {
    spdlog::error("Reward of {} to {} failed", reward.str(),
                  lanebridge::schema::to_hex(to));
  }
}

}  // namespace lanebridge::reward
