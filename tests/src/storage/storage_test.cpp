#include <lanebridge/schema/key/fee_market_keys.hpp>
#include <lanebridge/schema/order.hpp>
#include <lanebridge/storage/rocksdb/storage.hpp>
#include <lanebridge/testing/common.hpp>
#include <gtest/gtest.h>

TEST(storage, put_get_and_erase_round_trip) {
  auto fixture = lanebridge::testing::storage_fixture{"lanebridge_storage_put"};
  auto& storage = fixture.storage();
  auto& encoder = fixture.encoder();

  const auto key =
      lanebridge::schema::key::make_balance_key(lanebridge::testing::make_account(1));
  EXPECT_FALSE(
      storage.get<lanebridge::schema::account_balance_t>(encoder, key).has_value());

  auto balance = lanebridge::schema::account_balance_t{};
  balance.free = lanebridge::schema::amount_t{"340282366920938463463374607431768211457"};
  storage.put(encoder, key, balance);

  auto loaded = storage.get<lanebridge::schema::account_balance_t>(encoder, key);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded, balance);

  storage.erase(key);
  EXPECT_FALSE(
      storage.get<lanebridge::schema::account_balance_t>(encoder, key).has_value());
}

TEST(storage, list_by_prefix_stops_at_prefix_boundary) {
  auto fixture = lanebridge::testing::storage_fixture{"lanebridge_storage_prefix"};
  auto& storage = fixture.storage();
  auto& encoder = fixture.encoder();

  for (uint8_t seed = 1; seed <= 3; ++seed) {
    auto record = lanebridge::schema::relayer_t{};
    record.id = lanebridge::testing::make_account(seed);
    record.fee = seed;
    storage.put(encoder, lanebridge::schema::key::make_relayer_key(record.id),
                record);
  }
  storage.put(encoder, lanebridge::schema::key::make_relayer_sequence_key(),
              uint64_t{3});

  const auto entries = storage.list_by_prefix(lanebridge::schema::make_bytes(
      lanebridge::schema::key::kRelayerKeyPrefix));
  ASSERT_EQ(entries.size(), 3u);
  for (const auto& [key, value] : entries) {
    auto record = encoder.decode<lanebridge::schema::relayer_t>(value);
    EXPECT_EQ(key, lanebridge::schema::key::make_relayer_key(record.id));
  }
}
