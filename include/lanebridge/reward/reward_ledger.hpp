#pragma once

#include <lanebridge/reward/currency.hpp>
#include <lanebridge/reward/order_book.hpp>
#include <lanebridge/reward/relayer_registry.hpp>
#include <lanebridge/reward/rewards_book.hpp>
#include <lanebridge/reward/slasher.hpp>
#include <lanebridge/schema/lane_data.hpp>
#include <lanebridge/schema/message_payload.hpp>
#include <lanebridge/schema/permill.hpp>
#include <lanebridge/schema/primitives.hpp>
#include <lanebridge/schema/reward_item.hpp>

#include <optional>
#include <vector>

namespace lanebridge::reward {

struct reward_settings final {
  /// Holds message fees until they are paid out; receives slashes.
  lanebridge::schema::account_id_t fund_account{};
  lanebridge::schema::account_id_t treasury_account{};
  /// Share of the message fee that pays relayers; the rest of the pool goes
  /// to the treasury when delivered on time.
  lanebridge::schema::permill_t base_fee_ratio{};
  /// Share of the base fee paid to the relayer of the delivering slot.
  lanebridge::schema::permill_t assigned_relayers_reward_ratio{};
  /// Share of the relayers' part paid to the message relayer; the confirm
  /// relayer receives the remainder.
  lanebridge::schema::permill_t message_relayers_reward_ratio{};
  /// Share of each assignee's locked collateral slashed for a missed slot.
  lanebridge::schema::permill_t assigned_relayer_slash_ratio{};
  /// Ceiling for one relayer's slash after all deadlines passed.
  std::optional<lanebridge::schema::amount_t> collateral_slash_protect;
};

using reward_settings_t = reward_settings;

/// Outcome of settling one confirmed range.
struct settlement final {
  rewards_book_t book;
  std::vector<lanebridge::schema::order_reward_t> rewards;
  std::vector<lanebridge::schema::slash_report_t> slashes;
  lanebridge::schema::amount_t total_fees{};
  lanebridge::schema::amount_t total_slashed{};
};

using settlement_t = settlement;

/// Fee market payment: takes message fees into the fund, turns confirmed
/// orders into reward items (slashing late assignees) and pays the batch.
class reward_ledger final {
 public:
  reward_ledger(reward_settings_t settings,
                currency& currency,
                const slasher& slasher,
                relayer_registry& registry,
                order_book& orders);

  /// Move the message fee from the submitter to the fund account. Only a
  /// signed submitter has an account to pay from; any other origin may only
  /// send with a zero fee.
  bool pay_delivery_and_dispatch_fee(
      const lanebridge::schema::local_origin_t& submitter,
      const lanebridge::schema::amount_t& fee);

  /// Build one reward item per confirmed nonce of `received_range` and fold
  /// them into a book. Orders that were paid for are settled.
  settlement_t slash_and_calculate_rewards(
      const lanebridge::schema::lane_id_t& lane,
      const std::vector<lanebridge::schema::unrewarded_relayer_t>&
          messages_relayers,
      const lanebridge::schema::account_id_t& confirm_relayer,
      const lanebridge::schema::delivered_messages_t& received_range,
      lanebridge::schema::block_number_t now);

  /// One transfer per recipient out of the fund. Failures are logged only.
  void pay_relayers_rewards(
      const rewards_book_t& book,
      const lanebridge::schema::account_id_t& confirm_relayer);

  const reward_settings_t& settings() const { return settings_; }

 private:
  /// Transfer up to `amount` (capped at the locked collateral) from `who` to
  /// the fund and re-lock the rest. Returns the amount actually moved.
  lanebridge::schema::amount_t slash_assigned_relayer(
      const lanebridge::schema::order_t& order,
      const lanebridge::schema::account_id_t& who,
      const lanebridge::schema::amount_t& amount,
      std::vector<lanebridge::schema::slash_report_t>& reports);

  void rewards_before_deadline(
      const lanebridge::schema::account_id_t& slot_relayer,
      const lanebridge::schema::account_id_t& message_relayer,
      const lanebridge::schema::account_id_t& confirm_relayer,
      const lanebridge::schema::amount_t& total_reward,
      const lanebridge::schema::amount_t& base_fee,
      lanebridge::schema::reward_item_t& item) const;

  void rewards_after_deadline(
      const lanebridge::schema::account_id_t& message_relayer,
      const lanebridge::schema::account_id_t& confirm_relayer,
      const lanebridge::schema::amount_t& total_reward,
      lanebridge::schema::reward_item_t& item) const;

  void do_reward(const lanebridge::schema::account_id_t& to,
                 const lanebridge::schema::amount_t& reward);

  reward_settings_t settings_;
  currency& currency_;
  const slasher& slasher_;
  relayer_registry& registry_;
  order_book& orders_;
};

}  // namespace lanebridge::reward
