#include <lanebridge/dispatch/dispatcher.hpp>
#include <lanebridge/dispatch/origin.hpp>
#include <lanebridge/testing/common.hpp>
#include <lanebridge/testing/keys.hpp>
#include <gtest/gtest.h>

namespace {

using lanebridge::schema::bridge_error_code_t;
using lanebridge::schema::dispatch_status_t;

const auto kSourceChain = lanebridge::schema::chain_id_t{0x00, 0x00, 0x00, 0x02};
const auto kTargetChain = lanebridge::schema::chain_id_t{0x00, 0x00, 0x00, 0x01};
constexpr auto kSpecVersion = uint32_t{3};

class dispatcher_test : public ::testing::Test {
 protected:
  lanebridge::testing::scale_encoder_t encoder;
  lanebridge::testing::recording_runtime runtime;
  lanebridge::dispatch::dispatcher dispatcher{
      lanebridge::dispatch::dispatch_settings_t{kSourceChain, kTargetChain,
                                                kSpecVersion},
      runtime};
  const lanebridge::schema::account_id_t relayer =
      lanebridge::testing::make_account(0x77);
  const lanebridge::schema::message_key_t id{lanebridge::testing::make_lane(1),
                                             1};
};

}  // namespace

TEST_F(dispatcher_test, dispatches_source_account_under_derived_account) {
  const auto source = lanebridge::testing::make_account(1);
  auto payload = lanebridge::testing::make_payload(
      encoder, kSpecVersion, lanebridge::schema::source_account_t{source});
  runtime.actual = lanebridge::schema::weight_t{400};

  const auto event = dispatcher.dispatch(relayer, id, payload);
  EXPECT_EQ(event.status, dispatch_status_t::dispatched);
  EXPECT_TRUE(event.result.dispatch_result);
  EXPECT_EQ(event.result.unspent_weight.ref_time(), 600u);
  EXPECT_EQ(event.source_chain, kSourceChain);
  ASSERT_EQ(runtime.executed.size(), 1u);
  EXPECT_EQ(runtime.executed[0].first,
            lanebridge::dispatch::derive_source_account(kSourceChain, source));
}

TEST_F(dispatcher_test, version_mismatch_refunds_declared_weight) {
  auto payload = lanebridge::testing::make_payload(
      encoder, kSpecVersion + 1, lanebridge::schema::source_root_t{}, 5'000);

  const auto event = dispatcher.dispatch(relayer, id, payload);
  EXPECT_EQ(event.status, dispatch_status_t::rejected);
  EXPECT_EQ(event.error, bridge_error_code_t::version_mismatch);
  EXPECT_EQ(event.result.unspent_weight.ref_time(), 5'000u);
  EXPECT_TRUE(runtime.executed.empty());
}

TEST_F(dispatcher_test, undecodable_payload_is_rejected_with_no_refund) {
  const auto event = dispatcher.dispatch(relayer, id, std::nullopt);
  EXPECT_EQ(event.status, dispatch_status_t::rejected);
  EXPECT_EQ(event.error, bridge_error_code_t::message_rejected);
  EXPECT_TRUE(event.result.unspent_weight.is_zero());
}

TEST_F(dispatcher_test, malformed_call_is_a_decode_failure) {
  auto payload = lanebridge::testing::make_payload(
      encoder, kSpecVersion, lanebridge::schema::source_root_t{});
  payload.call = lanebridge::schema::bytes_t{0x01};

  const auto event = dispatcher.dispatch(relayer, id, payload);
  EXPECT_EQ(event.error, bridge_error_code_t::decode_failure);
  EXPECT_TRUE(runtime.executed.empty());
}

TEST_F(dispatcher_test, weight_below_minimal_is_never_executed) {
  runtime.minimal = lanebridge::schema::weight_t{2'000};
  auto payload = lanebridge::testing::make_payload(
      encoder, kSpecVersion, lanebridge::schema::source_root_t{}, 1'999);

  const auto event = dispatcher.dispatch(relayer, id, payload);
  EXPECT_EQ(event.status, dispatch_status_t::rejected);
  EXPECT_EQ(event.error, bridge_error_code_t::weight_mismatch);
  EXPECT_EQ(event.result.unspent_weight.ref_time(), 1'999u);
  EXPECT_TRUE(runtime.executed.empty());
}

TEST_F(dispatcher_test, validator_can_refuse_origin) {
  dispatcher.set_call_validator(
      [](const auto&, const auto&, const lanebridge::schema::call_t& call)
          -> std::optional<std::string> {
        if (call.call_index == 1) {
          return std::string{"call not allowed from bridge"};
        }
        return std::nullopt;
      });
  auto payload = lanebridge::testing::make_payload(
      encoder, kSpecVersion, lanebridge::schema::source_root_t{});

  const auto event = dispatcher.dispatch(relayer, id, payload);
  EXPECT_EQ(event.error, bridge_error_code_t::origin_rejected);
  EXPECT_EQ(event.detail, "call not allowed from bridge");
  EXPECT_TRUE(runtime.executed.empty());
}

TEST_F(dispatcher_test, target_chain_fee_requires_payer) {
  auto payload = lanebridge::testing::make_payload(
      encoder, kSpecVersion, lanebridge::schema::source_root_t{});
  payload.dispatch_fee_payment =
      lanebridge::schema::dispatch_fee_payment_t::at_target_chain;

  auto event = dispatcher.dispatch(relayer, id, payload);
  EXPECT_EQ(event.error, bridge_error_code_t::fee_payment_failed);

  auto charged = lanebridge::schema::weight_t{};
  dispatcher.set_dispatch_fee_payer(
      [&](const auto&, const lanebridge::schema::weight_t& weight) {
        charged = weight;
        return true;
      });
  event = dispatcher.dispatch(relayer, id, payload);
  EXPECT_EQ(event.status, dispatch_status_t::dispatched);
  EXPECT_TRUE(event.result.dispatch_fee_paid_during_dispatch);
  EXPECT_EQ(charged, payload.weight);
}

TEST_F(dispatcher_test, failed_call_is_reported_not_rejected) {
  runtime.succeed = false;
  auto payload = lanebridge::testing::make_payload(
      encoder, kSpecVersion, lanebridge::schema::source_root_t{});

  const auto event = dispatcher.dispatch(relayer, id, payload);
  EXPECT_EQ(event.status, dispatch_status_t::failed);
  EXPECT_EQ(event.error, bridge_error_code_t::call_failed);
  EXPECT_FALSE(event.result.dispatch_result);
  EXPECT_EQ(event.detail, "call reverted");
  EXPECT_EQ(runtime.executed.size(), 1u);
}

TEST_F(dispatcher_test, target_account_needs_ownership_signature) {
  auto keypair = lanebridge::testing::ed25519_keypair::generate();
  if (!keypair) {
    GTEST_SKIP() << "OpenSSL backend does not support ed25519";
  }
  const auto source = lanebridge::testing::make_account(5);
  auto origin = lanebridge::schema::target_account_t{};
  origin.source_id = source;
  origin.target_public = keypair->signer();
  auto payload = lanebridge::testing::make_payload(encoder, kSpecVersion,
                                                   origin);

  const auto digest = lanebridge::dispatch::ownership_digest(
      payload.call, source, kSpecVersion, kSourceChain, kTargetChain);
  auto signature = keypair->sign(digest);
  ASSERT_TRUE(signature.has_value());
  origin.signature = *signature;
  payload.origin = origin;

  auto event = dispatcher.dispatch(relayer, id, payload);
  EXPECT_EQ(event.status, dispatch_status_t::dispatched);
  ASSERT_EQ(runtime.executed.size(), 1u);
  EXPECT_EQ(runtime.executed[0].first,
            lanebridge::schema::account_id_t{keypair->signer().public_key});

  // Signed for another chain pair.
  const auto wrong_digest = lanebridge::dispatch::ownership_digest(
      payload.call, source, kSpecVersion, kTargetChain, kSourceChain);
  origin.signature = *keypair->sign(wrong_digest);
  payload.origin = origin;
  event = dispatcher.dispatch(relayer, id, payload);
  EXPECT_EQ(event.error, bridge_error_code_t::signature_mismatch);
  EXPECT_EQ(runtime.executed.size(), 1u);
}
