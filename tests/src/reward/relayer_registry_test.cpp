#include <lanebridge/reward/currency.hpp>
#include <lanebridge/reward/order_book.hpp>
#include <lanebridge/reward/relayer_registry.hpp>
#include <lanebridge/testing/common.hpp>
#include <gtest/gtest.h>

namespace {

using lanebridge::schema::amount_t;
using lanebridge::schema::bridge_error_code_t;

class relayer_registry_test : public ::testing::Test {
 protected:
  relayer_registry_test()
      : fixture{"lanebridge_registry"},
        currency{fixture.encoder(), fixture.storage()},
        orders{fixture.encoder(), fixture.storage()},
        registry{fixture.encoder(), fixture.storage(), currency, orders} {}

  lanebridge::schema::account_id_t funded(const uint8_t seed,
                                          const amount_t& balance = 1'000) {
    const auto id = lanebridge::testing::make_account(seed);
    currency.deposit(id, balance);
    return id;
  }

  lanebridge::testing::storage_fixture fixture;
  lanebridge::reward::storage_currency currency;
  lanebridge::reward::order_book orders;
  lanebridge::reward::relayer_registry registry;
};

}  // namespace

TEST_F(relayer_registry_test, enroll_checks_balance_and_duplicates) {
  const auto alice = funded(1);

  EXPECT_EQ(registry.enroll(alice, amount_t{0}, amount_t{10}),
            bridge_error_code_t::insufficient_collateral);
  EXPECT_EQ(registry.enroll(alice, amount_t{1'001}, amount_t{10}),
            bridge_error_code_t::insufficient_balance);
  EXPECT_EQ(registry.enroll(alice, amount_t{500}, amount_t{10}),
            bridge_error_code_t::ok);
  EXPECT_EQ(registry.enroll(alice, amount_t{500}, amount_t{10}),
            bridge_error_code_t::relayer_already_enrolled);

  auto record = registry.relayer(alice);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->collateral, 500);
  EXPECT_EQ(record->fee, 10);
  EXPECT_EQ(registry.locked_collateral(alice), 500);
  EXPECT_EQ(registry.relayers().size(), 1u);
}

TEST_F(relayer_registry_test, enrolled_collateral_cannot_be_spent) {
  const auto alice = funded(1);
  const auto bob = funded(2, amount_t{0});
  ASSERT_EQ(registry.enroll(alice, amount_t{500}, amount_t{10}),
            bridge_error_code_t::ok);

  EXPECT_EQ(currency.locked(alice), 500);
  EXPECT_EQ(currency.free_balance(alice), 500);
  EXPECT_FALSE(currency.transfer(alice, bob, amount_t{501}));
  EXPECT_TRUE(currency.transfer(alice, bob, amount_t{500}));
  EXPECT_EQ(currency.balance(alice), 500);
  EXPECT_FALSE(currency.transfer(alice, bob, amount_t{1}));

  // Only the unlocked balance can back a second enrollment.
  currency.deposit(bob, amount_t{100});
  ASSERT_EQ(registry.enroll(bob, amount_t{600}, amount_t{10}),
            bridge_error_code_t::ok);
  EXPECT_FALSE(currency.transfer(bob, alice, amount_t{1}));
}

TEST_F(relayer_registry_test, updates_require_enrollment) {
  const auto alice = funded(1);
  const auto stranger = lanebridge::testing::make_account(9);

  EXPECT_EQ(registry.update_collateral(stranger, amount_t{1}),
            bridge_error_code_t::relayer_not_enrolled);
  EXPECT_EQ(registry.update_fee(stranger, amount_t{1}),
            bridge_error_code_t::relayer_not_enrolled);
  EXPECT_EQ(registry.cancel(stranger),
            bridge_error_code_t::relayer_not_enrolled);
  EXPECT_EQ(registry.locked_collateral(stranger), 0);

  ASSERT_EQ(registry.enroll(alice, amount_t{100}, amount_t{10}),
            bridge_error_code_t::ok);
  EXPECT_EQ(registry.update_collateral(alice, amount_t{2'000}),
            bridge_error_code_t::insufficient_balance);
  EXPECT_EQ(registry.update_collateral(alice, amount_t{0}),
            bridge_error_code_t::insufficient_collateral);
  EXPECT_EQ(registry.update_collateral(alice, amount_t{300}),
            bridge_error_code_t::ok);
  EXPECT_EQ(registry.update_fee(alice, amount_t{25}), bridge_error_code_t::ok);
  EXPECT_EQ(registry.relayer(alice)->collateral, 300);
  EXPECT_EQ(registry.relayer(alice)->fee, 25);
  EXPECT_EQ(currency.locked(alice), 300);

  registry.set_locked_collateral(alice, amount_t{120});
  EXPECT_EQ(registry.locked_collateral(alice), 120);
  EXPECT_EQ(currency.locked(alice), 120);

  EXPECT_EQ(registry.cancel(alice), bridge_error_code_t::ok);
  EXPECT_EQ(currency.locked(alice), 0);
  EXPECT_FALSE(registry.relayer(alice).has_value());
  EXPECT_TRUE(registry.relayers().empty());
}

TEST_F(relayer_registry_test, assignment_prefers_cheap_then_early) {
  const auto expensive = funded(1);
  const auto early = funded(2);
  const auto late = funded(3);
  const auto undercollateralized = funded(4);

  ASSERT_EQ(registry.enroll(expensive, amount_t{100}, amount_t{30}),
            bridge_error_code_t::ok);
  ASSERT_EQ(registry.enroll(late, amount_t{100}, amount_t{10}),
            bridge_error_code_t::ok);
  ASSERT_EQ(registry.enroll(early, amount_t{100}, amount_t{10}),
            bridge_error_code_t::ok);
  ASSERT_EQ(registry.enroll(undercollateralized, amount_t{50}, amount_t{1}),
            bridge_error_code_t::ok);

  auto assigned = registry.assigned_relayers(3, amount_t{100});
  ASSERT_TRUE(assigned.has_value());
  ASSERT_EQ(assigned->size(), 3u);
  // `late` enrolled before `early` despite its name.
  EXPECT_EQ((*assigned)[0].id, late);
  EXPECT_EQ((*assigned)[1].id, early);
  EXPECT_EQ((*assigned)[2].id, expensive);
  EXPECT_EQ(registry.market_fee(3, amount_t{100}), amount_t{30});
  EXPECT_EQ(registry.market_fee(2, amount_t{100}), amount_t{10});

  EXPECT_FALSE(registry.assigned_relayers(4, amount_t{100}).has_value());
  EXPECT_FALSE(registry.market_fee(4, amount_t{100}).has_value());

  // A lower requirement lets the cheap relayer in.
  EXPECT_EQ(registry.market_fee(1, amount_t{50}), amount_t{1});
}

TEST_F(relayer_registry_test, assigned_relayer_keeps_committed_collateral) {
  const auto alice = funded(1);
  const auto bob = funded(2);
  const auto lane = lanebridge::testing::make_lane(1);
  ASSERT_EQ(registry.enroll(alice, amount_t{200}, amount_t{10}),
            bridge_error_code_t::ok);
  ASSERT_EQ(registry.enroll(bob, amount_t{200}, amount_t{10}),
            bridge_error_code_t::ok);

  orders.create_order(lane, 1, amount_t{10}, 5, {*registry.relayer(alice)},
                      10, amount_t{150});
  orders.create_order(lanebridge::testing::make_lane(2), 1, amount_t{10}, 5,
                      {*registry.relayer(bob)}, 10, amount_t{150});
  EXPECT_EQ(registry.occupied_collateral(alice), 150);

  EXPECT_EQ(registry.cancel(alice), bridge_error_code_t::relayer_occupied);
  EXPECT_EQ(registry.update_collateral(alice, amount_t{100}),
            bridge_error_code_t::relayer_occupied);
  EXPECT_EQ(registry.locked_collateral(alice), 200);
  EXPECT_EQ(currency.locked(alice), 200);

  EXPECT_EQ(registry.update_collateral(alice, amount_t{150}),
            bridge_error_code_t::ok);
  EXPECT_EQ(currency.locked(alice), 150);
  EXPECT_FALSE(currency.transfer(alice, bob, amount_t{851}));

  orders.settle(lane, 1);
  EXPECT_EQ(registry.occupied_collateral(alice), 0);
  EXPECT_EQ(registry.cancel(alice), bridge_error_code_t::ok);
  EXPECT_EQ(currency.locked(alice), 0);
  EXPECT_TRUE(currency.transfer(alice, bob, amount_t{1'000}));

  // Bob's order on the other lane is still open.
  EXPECT_EQ(registry.cancel(bob), bridge_error_code_t::relayer_occupied);
}
