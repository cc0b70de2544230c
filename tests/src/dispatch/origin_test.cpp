#include <lanebridge/dispatch/origin.hpp>
#include <lanebridge/testing/common.hpp>
#include <gtest/gtest.h>

namespace {

const auto kChain = lanebridge::schema::chain_id_t{0x00, 0x00, 0x00, 0x02};
const auto kOtherChain = lanebridge::schema::chain_id_t{0x00, 0x00, 0x00, 0x03};

lanebridge::schema::message_payload_t with_origin(
    lanebridge::schema::call_origin_t origin) {
  auto payload = lanebridge::schema::message_payload_t{};
  payload.origin = std::move(origin);
  return payload;
}

}  // namespace

TEST(origin, source_root_requires_root_submitter) {
  const auto payload = with_origin(lanebridge::schema::source_root_t{});
  EXPECT_TRUE(lanebridge::dispatch::verify_message_origin(
      lanebridge::schema::root_origin_t{}, payload));
  EXPECT_FALSE(lanebridge::dispatch::verify_message_origin(
      lanebridge::schema::signed_origin_t{lanebridge::testing::make_account(1)},
      payload));
  EXPECT_FALSE(lanebridge::dispatch::verify_message_origin(
      lanebridge::schema::none_origin_t{}, payload));
}

TEST(origin, source_account_accepts_owner_or_root) {
  const auto owner = lanebridge::testing::make_account(1);
  const auto payload =
      with_origin(lanebridge::schema::source_account_t{owner});
  EXPECT_TRUE(lanebridge::dispatch::verify_message_origin(
      lanebridge::schema::signed_origin_t{owner}, payload));
  EXPECT_TRUE(lanebridge::dispatch::verify_message_origin(
      lanebridge::schema::root_origin_t{}, payload));
  EXPECT_FALSE(lanebridge::dispatch::verify_message_origin(
      lanebridge::schema::signed_origin_t{lanebridge::testing::make_account(2)},
      payload));
}

TEST(origin, target_account_accepts_only_the_source_id) {
  const auto owner = lanebridge::testing::make_account(1);
  auto origin = lanebridge::schema::target_account_t{};
  origin.source_id = owner;
  origin.target_public = lanebridge::schema::ed25519_signer_id_t{};
  origin.signature = lanebridge::schema::ed25519_signature_t{};
  const auto payload = with_origin(origin);

  EXPECT_TRUE(lanebridge::dispatch::verify_message_origin(
      lanebridge::schema::signed_origin_t{owner}, payload));
  EXPECT_FALSE(lanebridge::dispatch::verify_message_origin(
      lanebridge::schema::root_origin_t{}, payload));
}

TEST(origin, derived_accounts_are_chain_scoped) {
  const auto id = lanebridge::testing::make_account(9);
  const auto account = lanebridge::dispatch::derive_source_account(kChain, id);
  EXPECT_NE(account, id);
  EXPECT_NE(account, lanebridge::dispatch::derive_source_account(kOtherChain, id));
  EXPECT_EQ(account, lanebridge::dispatch::derive_source_account(kChain, id));

  const auto root = lanebridge::dispatch::derive_source_root_account(kChain);
  EXPECT_NE(root, lanebridge::dispatch::derive_source_root_account(kOtherChain));
  EXPECT_NE(root, account);
}

TEST(origin, ownership_digest_binds_every_field) {
  const auto call = lanebridge::schema::bytes_t{0x01, 0x02};
  const auto id = lanebridge::testing::make_account(4);
  const auto digest =
      lanebridge::dispatch::ownership_digest(call, id, 1, kChain, kOtherChain);

  EXPECT_NE(digest,
            lanebridge::dispatch::ownership_digest(call, id, 2, kChain, kOtherChain));
  EXPECT_NE(digest,
            lanebridge::dispatch::ownership_digest(call, id, 1, kOtherChain, kChain));
  EXPECT_NE(digest, lanebridge::dispatch::ownership_digest(
                        lanebridge::schema::bytes_t{0x01, 0x03}, id, 1, kChain,
                        kOtherChain));
}
