#include <lanebridge/reward/currency.hpp>
#include <lanebridge/reward/order_book.hpp>
#include <lanebridge/reward/relayer_registry.hpp>
#include <lanebridge/reward/reward_ledger.hpp>
#include <lanebridge/reward/slasher.hpp>
#include <lanebridge/testing/common.hpp>
#include <gtest/gtest.h>

namespace {

using lanebridge::schema::amount_t;
using lanebridge::schema::bridge_error_code_t;
using lanebridge::schema::permill_t;

constexpr auto kSentTime = lanebridge::schema::block_number_t{10};
constexpr auto kSlotLength = lanebridge::schema::block_number_t{5};

/// Stored balances that can refuse every transfer out of one account.
class freezable_currency final : public lanebridge::reward::currency {
 public:
  explicit freezable_currency(lanebridge::reward::storage_currency& balances)
      : balances_{balances} {}

  bool transfer(const lanebridge::schema::account_id_t& from,
                const lanebridge::schema::account_id_t& to,
                const amount_t& amount) override {
    if (frozen_ == from) {
      return false;
    }
    return balances_.transfer(from, to, amount);
  }

  amount_t balance(
      const lanebridge::schema::account_id_t& account) const override {
    return balances_.balance(account);
  }

  amount_t locked(
      const lanebridge::schema::account_id_t& account) const override {
    return balances_.locked(account);
  }

  void set_lock(const lanebridge::schema::account_id_t& account,
                const amount_t& amount) override {
    balances_.set_lock(account, amount);
  }

  void deposit(const lanebridge::schema::account_id_t& account,
               const amount_t& amount) {
    balances_.deposit(account, amount);
  }

  void freeze(const lanebridge::schema::account_id_t& account) {
    frozen_ = account;
  }

 private:
  lanebridge::reward::storage_currency& balances_;
  std::optional<lanebridge::schema::account_id_t> frozen_;
};

class reward_ledger_test : public ::testing::Test {
 protected:
  reward_ledger_test()
      : fixture{"lanebridge_rewards"},
        balances{fixture.encoder(), fixture.storage()},
        currency{balances},
        orders{fixture.encoder(), fixture.storage()},
        registry{fixture.encoder(), fixture.storage(), currency, orders},
        slasher{amount_t{2}} {
    for (const auto& [id, fee] :
         {std::pair{first, 10}, std::pair{second, 20}, std::pair{third, 30}}) {
      currency.deposit(id, amount_t{1'000});
      EXPECT_EQ(registry.enroll(id, amount_t{100}, amount_t{fee}),
                bridge_error_code_t::ok);
    }
  }

  lanebridge::reward::reward_settings_t settings(
      std::optional<amount_t> protect = std::nullopt) const {
    auto out = lanebridge::reward::reward_settings_t{};
    out.fund_account = fund;
    out.treasury_account = treasury;
    out.base_fee_ratio = permill_t::from_percent(40);
    out.assigned_relayers_reward_ratio = permill_t::from_percent(50);
    out.message_relayers_reward_ratio = permill_t::from_percent(80);
    out.assigned_relayer_slash_ratio = permill_t::from_percent(10);
    out.collateral_slash_protect = protect;
    return out;
  }

  /// Accepts message `nonce` paying `fee` into the fund.
  void send(const lanebridge::schema::message_nonce_t nonce,
            const amount_t& fee = 100) {
    auto assigned = registry.assigned_relayers(3, amount_t{100});
    ASSERT_TRUE(assigned.has_value());
    orders.create_order(lane, nonce, fee, kSentTime, *assigned, kSlotLength,
                        amount_t{100});
    currency.deposit(fund, fee);
  }

  lanebridge::reward::settlement_t confirm_at(
      lanebridge::reward::reward_ledger& ledger,
      const lanebridge::schema::delivered_messages_t& range,
      const lanebridge::schema::block_number_t at) {
    orders.confirm(lane, range, at);
    return ledger.slash_and_calculate_rewards(
        lane, {lanebridge::schema::unrewarded_relayer_t{deliverer, range}},
        confirmer, range, at + 100);
  }

  lanebridge::testing::storage_fixture fixture;
  lanebridge::reward::storage_currency balances;
  freezable_currency currency;
  lanebridge::reward::order_book orders;
  lanebridge::reward::relayer_registry registry;
  lanebridge::reward::linear_slasher slasher;

  const lanebridge::schema::lane_id_t lane = lanebridge::testing::make_lane(1);
  const lanebridge::schema::account_id_t fund =
      lanebridge::testing::make_account(0xF0);
  const lanebridge::schema::account_id_t treasury =
      lanebridge::testing::make_account(0xF1);
  const lanebridge::schema::account_id_t first =
      lanebridge::testing::make_account(1);
  const lanebridge::schema::account_id_t second =
      lanebridge::testing::make_account(2);
  const lanebridge::schema::account_id_t third =
      lanebridge::testing::make_account(3);
  const lanebridge::schema::account_id_t deliverer =
      lanebridge::testing::make_account(0x0D);
  const lanebridge::schema::account_id_t confirmer =
      lanebridge::testing::make_account(0x0C);
};

}  // namespace

TEST(order_slots, windows_follow_assignment_order) {
  auto order = lanebridge::schema::order_t{};
  order.relayers = {
      lanebridge::schema::priority_relayer_t{
          lanebridge::testing::make_account(1), amount_t{1}, 10, 15},
      lanebridge::schema::priority_relayer_t{
          lanebridge::testing::make_account(2), amount_t{2}, 15, 20}};

  EXPECT_FALSE(lanebridge::schema::delivery_slot(order, 9).has_value());
  EXPECT_EQ(lanebridge::schema::delivery_slot(order, 10), 0u);
  EXPECT_EQ(lanebridge::schema::delivery_slot(order, 14), 0u);
  EXPECT_EQ(lanebridge::schema::delivery_slot(order, 15), 1u);
  EXPECT_FALSE(lanebridge::schema::delivery_slot(order, 20).has_value());
  EXPECT_EQ(lanebridge::schema::delivery_delay(order, 19), 0u);
  EXPECT_EQ(lanebridge::schema::delivery_delay(order, 27), 7u);
}

TEST(linear_slasher, grows_with_delay_up_to_collateral) {
  const auto slasher = lanebridge::reward::linear_slasher{amount_t{3}};
  EXPECT_EQ(slasher.slash_amount(amount_t{100}, 0), 0);
  EXPECT_EQ(slasher.slash_amount(amount_t{100}, 10), 30);
  EXPECT_EQ(slasher.slash_amount(amount_t{100}, 50), 100);
}

TEST_F(reward_ledger_test, order_records_slots_and_confirmation) {
  send(1);
  auto order = orders.order(lane, 1);
  ASSERT_TRUE(order.has_value());
  ASSERT_EQ(order->relayers.size(), 3u);
  EXPECT_EQ(order->relayers[0].id, first);
  EXPECT_EQ(order->relayers[0].valid_range_start, 10u);
  EXPECT_EQ(order->relayers[2].valid_range_end, 25u);
  EXPECT_FALSE(order->confirm_time.has_value());

  orders.confirm(lane, lanebridge::schema::delivered_messages_t{1, 1}, 13);
  EXPECT_EQ(orders.order(lane, 1)->confirm_time, 13u);
  EXPECT_FALSE(orders.is_settled(lane, 1));
  orders.settle(lane, 1);
  EXPECT_TRUE(orders.is_settled(lane, 1));
}

TEST_F(reward_ledger_test, first_slot_splits_fee) {
  auto ledger = lanebridge::reward::reward_ledger{settings(), currency, slasher,
                                                  registry, orders};
  send(1);

  const auto settlement =
      confirm_at(ledger, lanebridge::schema::delivered_messages_t{1, 1}, 12);
  ASSERT_EQ(settlement.rewards.size(), 1u);
  const auto& item = settlement.rewards[0].item;
  ASSERT_TRUE(item.to_slot_relayer.has_value());
  EXPECT_EQ(item.to_slot_relayer->first, first);
  EXPECT_EQ(item.to_slot_relayer->second, 20);
  EXPECT_EQ(item.to_treasury, amount_t{60});
  EXPECT_EQ(item.to_message_relayer->second, 16);
  EXPECT_EQ(item.to_confirm_relayer->second, 4);
  EXPECT_TRUE(settlement.slashes.empty());
  EXPECT_EQ(settlement.total_fees, 100);
  EXPECT_EQ(settlement.book.total(), 100);
  EXPECT_TRUE(orders.is_settled(lane, 1));

  ledger.pay_relayers_rewards(settlement.book, confirmer);
  EXPECT_EQ(currency.balance(first), 1'020);
  EXPECT_EQ(currency.balance(deliverer), 16);
  EXPECT_EQ(currency.balance(confirmer), 4);
  EXPECT_EQ(currency.balance(treasury), 60);
  EXPECT_EQ(currency.balance(fund), 0);
}

TEST_F(reward_ledger_test, late_slot_slashes_earlier_assignees) {
  auto ledger = lanebridge::reward::reward_ledger{settings(), currency, slasher,
                                                  registry, orders};
  send(1);

  const auto settlement =
      confirm_at(ledger, lanebridge::schema::delivered_messages_t{1, 1}, 22);
  ASSERT_EQ(settlement.slashes.size(), 2u);
  EXPECT_EQ(settlement.slashes[0].relayer, first);
  EXPECT_EQ(settlement.slashes[1].relayer, second);
  EXPECT_EQ(settlement.slashes[0].slashed, 10);
  EXPECT_EQ(settlement.total_slashed, 20);
  EXPECT_EQ(registry.locked_collateral(first), 90);
  EXPECT_EQ(registry.locked_collateral(second), 90);
  EXPECT_EQ(registry.locked_collateral(third), 100);
  EXPECT_EQ(currency.locked(first), 90);
  EXPECT_EQ(currency.locked(third), 100);

  const auto& item = settlement.rewards[0].item;
  EXPECT_EQ(item.to_slot_relayer->first, third);
  EXPECT_EQ(item.to_slot_relayer->second, 20);
  EXPECT_EQ(item.to_treasury, amount_t{80});
  EXPECT_EQ(settlement.book.total(),
            settlement.total_fees + settlement.total_slashed);

  ledger.pay_relayers_rewards(settlement.book, confirmer);
  EXPECT_EQ(currency.balance(first), 990);
  EXPECT_EQ(currency.balance(third), 1'020);
  EXPECT_EQ(currency.balance(fund), 0);
}

TEST_F(reward_ledger_test, after_deadline_everyone_is_slashed) {
  auto ledger = lanebridge::reward::reward_ledger{settings(), currency, slasher,
                                                  registry, orders};
  send(1);

  // Five blocks late: 2 per block plus 10% of the locked 100.
  const auto settlement =
      confirm_at(ledger, lanebridge::schema::delivered_messages_t{1, 1}, 30);
  ASSERT_EQ(settlement.slashes.size(), 3u);
  for (const auto& report : settlement.slashes) {
    EXPECT_EQ(report.slashed, 20);
  }
  const auto& item = settlement.rewards[0].item;
  EXPECT_FALSE(item.to_slot_relayer.has_value());
  EXPECT_FALSE(item.to_treasury.has_value());
  EXPECT_EQ(item.to_message_relayer->second, 128);
  EXPECT_EQ(item.to_confirm_relayer->second, 32);
  EXPECT_EQ(settlement.book.total(), 160);
}

TEST_F(reward_ledger_test, slash_protect_caps_each_relayer) {
  auto ledger = lanebridge::reward::reward_ledger{
      settings(amount_t{15}), currency, slasher, registry, orders};
  send(1);

  const auto settlement =
      confirm_at(ledger, lanebridge::schema::delivered_messages_t{1, 1}, 30);
  ASSERT_EQ(settlement.slashes.size(), 3u);
  for (const auto& report : settlement.slashes) {
    EXPECT_EQ(report.requested, 15);
    EXPECT_EQ(report.slashed, 15);
  }
  EXPECT_EQ(settlement.total_slashed, 45);
  EXPECT_EQ(settlement.rewards[0].item.to_message_relayer->second, 116);
  EXPECT_EQ(settlement.rewards[0].item.to_confirm_relayer->second, 29);
}

TEST_F(reward_ledger_test, failed_slash_keeps_collateral) {
  auto ledger = lanebridge::reward::reward_ledger{settings(), currency, slasher,
                                                  registry, orders};
  send(1);
  // Collateral stays put: only the unlocked 900 can leave.
  EXPECT_FALSE(currency.transfer(first, treasury, amount_t{1'000}));
  ASSERT_TRUE(currency.transfer(first, treasury, amount_t{900}));
  currency.freeze(first);

  const auto settlement =
      confirm_at(ledger, lanebridge::schema::delivered_messages_t{1, 1}, 17);
  ASSERT_EQ(settlement.slashes.size(), 1u);
  EXPECT_EQ(settlement.slashes[0].requested, 10);
  EXPECT_EQ(settlement.slashes[0].slashed, 0);
  EXPECT_EQ(settlement.total_slashed, 0);
  EXPECT_EQ(registry.locked_collateral(first), 100);
  EXPECT_EQ(currency.locked(first), 100);
  EXPECT_EQ(currency.balance(first), 100);
  EXPECT_EQ(settlement.book.total(), 100);
}

TEST_F(reward_ledger_test, book_sums_per_recipient) {
  auto ledger = lanebridge::reward::reward_ledger{settings(), currency, slasher,
                                                  registry, orders};
  send(1);
  send(2);
  send(3, amount_t{200});

  const auto settlement =
      confirm_at(ledger, lanebridge::schema::delivered_messages_t{1, 3}, 11);
  ASSERT_EQ(settlement.rewards.size(), 3u);
  EXPECT_EQ(settlement.total_fees, 400);
  EXPECT_EQ(settlement.book.deliver_sum.at(deliverer), 64);
  EXPECT_EQ(settlement.book.confirm_sum, 16);
  EXPECT_EQ(settlement.book.assigned_relayers_sum.at(first), 80);
  EXPECT_EQ(settlement.book.treasury_sum, 240);
  EXPECT_EQ(settlement.book.total(), 400);
}

TEST_F(reward_ledger_test, range_outside_entry_is_skipped) {
  auto ledger = lanebridge::reward::reward_ledger{settings(), currency, slasher,
                                                  registry, orders};
  send(1);
  send(2);

  const auto settlement = ledger.slash_and_calculate_rewards(
      lane,
      {lanebridge::schema::unrewarded_relayer_t{
          deliverer, lanebridge::schema::delivered_messages_t{1, 2}}},
      confirmer, lanebridge::schema::delivered_messages_t{2, 2}, 12);
  ASSERT_EQ(settlement.rewards.size(), 1u);
  EXPECT_EQ(settlement.rewards[0].nonce, 2u);
  EXPECT_FALSE(orders.is_settled(lane, 1));
  EXPECT_TRUE(orders.is_settled(lane, 2));
}

TEST_F(reward_ledger_test, only_signed_submitters_pay_fees) {
  auto ledger = lanebridge::reward::reward_ledger{settings(), currency, slasher,
                                                  registry, orders};
  const auto sender = lanebridge::testing::make_account(0x55);
  currency.deposit(sender, amount_t{50});

  EXPECT_TRUE(ledger.pay_delivery_and_dispatch_fee(
      lanebridge::schema::signed_origin_t{sender}, amount_t{30}));
  EXPECT_EQ(currency.balance(sender), 20);
  EXPECT_EQ(currency.balance(fund), 30);
  EXPECT_FALSE(ledger.pay_delivery_and_dispatch_fee(
      lanebridge::schema::signed_origin_t{sender}, amount_t{30}));

  EXPECT_TRUE(ledger.pay_delivery_and_dispatch_fee(
      lanebridge::schema::root_origin_t{}, amount_t{0}));
  EXPECT_FALSE(ledger.pay_delivery_and_dispatch_fee(
      lanebridge::schema::none_origin_t{}, amount_t{1}));
}
