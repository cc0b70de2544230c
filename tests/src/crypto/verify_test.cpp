#include <lanebridge/crypto/verify.hpp>
#include <lanebridge/testing/keys.hpp>
#include <gtest/gtest.h>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>

#include <array>
#include <optional>
#include <vector>

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif

namespace {

struct secp_fixture_t final {
  lanebridge::schema::secp256k1_signer_id_t signer;
  /// [v | r | s]
  lanebridge::schema::secp256k1_signature_t signature;
  std::vector<uint8_t> message;
};

std::optional<secp_fixture_t> make_secp_fixture() {
  auto* ec_key = EC_KEY_new_by_curve_name(NID_secp256k1);
  if (ec_key == nullptr || EC_KEY_generate_key(ec_key) != 1) {
    EC_KEY_free(ec_key);
    return std::nullopt;
  }
  EC_KEY_set_conv_form(ec_key, POINT_CONVERSION_COMPRESSED);

  auto fixture = secp_fixture_t{};
  auto* pub_ptr = fixture.signer.public_key.data();
  if (i2o_ECPublicKey(ec_key, &pub_ptr) !=
      static_cast<int>(fixture.signer.public_key.size())) {
    EC_KEY_free(ec_key);
    return std::nullopt;
  }

  fixture.message = std::vector<uint8_t>{'l', 'a', 'n', 'e', '-', 'm', 's', 'g'};
  auto digest = std::array<uint8_t, 32>{};
  auto digest_size = 0u;
  if (EVP_Digest(fixture.message.data(), fixture.message.size(), digest.data(),
                 &digest_size, EVP_sha256(), nullptr) != 1) {
    EC_KEY_free(ec_key);
    return std::nullopt;
  }
  auto* sig = ECDSA_do_sign(digest.data(), static_cast<int>(digest.size()),
                            ec_key);
  EC_KEY_free(ec_key);
  if (sig == nullptr) {
    return std::nullopt;
  }

  const auto* r = static_cast<const BIGNUM*>(nullptr);
  const auto* s = static_cast<const BIGNUM*>(nullptr);
  ECDSA_SIG_get0(sig, &r, &s);
  fixture.signature[0] = 0;
  const auto ok_r = BN_bn2binpad(r, fixture.signature.data() + 1, 32);
  const auto ok_s = BN_bn2binpad(s, fixture.signature.data() + 33, 32);
  ECDSA_SIG_free(sig);
  if (ok_r != 32 || ok_s != 32) {
    return std::nullopt;
  }
  return fixture;
}

}  // namespace

TEST(crypto_verify, verifies_ed25519_signatures) {
  if (!lanebridge::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto keypair = lanebridge::testing::ed25519_keypair::generate();
  ASSERT_TRUE(keypair.has_value());

  auto message = std::vector<uint8_t>{'l', 'a', 'n', 'e'};
  auto signature = keypair->sign(message);
  ASSERT_TRUE(signature.has_value());

  EXPECT_TRUE(lanebridge::crypto::verify_signature(
      message, lanebridge::schema::signer_id_t{keypair->signer()},
      lanebridge::schema::signature_t{*signature}));

  message[0] ^= 0x01;
  EXPECT_FALSE(lanebridge::crypto::verify_signature(
      message, lanebridge::schema::signer_id_t{keypair->signer()},
      lanebridge::schema::signature_t{*signature}));
}

TEST(crypto_verify, verifies_secp256k1_with_recovery_id_first_or_last) {
  if (!lanebridge::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = make_secp_fixture();
  ASSERT_TRUE(fixture.has_value());

  EXPECT_TRUE(lanebridge::crypto::verify_signature(
      fixture->message, lanebridge::schema::signer_id_t{fixture->signer},
      lanebridge::schema::signature_t{fixture->signature}));

  // [r | s | v]
  auto trailing = lanebridge::schema::secp256k1_signature_t{};
  std::copy(fixture->signature.begin() + 1, fixture->signature.end(),
            trailing.begin());
  trailing[64] = 27;
  EXPECT_TRUE(lanebridge::crypto::verify_signature(
      fixture->message, lanebridge::schema::signer_id_t{fixture->signer},
      lanebridge::schema::signature_t{trailing}));

  fixture->message[0] ^= 0x01;
  EXPECT_FALSE(lanebridge::crypto::verify_signature(
      fixture->message, lanebridge::schema::signer_id_t{fixture->signer},
      lanebridge::schema::signature_t{fixture->signature}));
}

TEST(crypto_verify, rejects_mismatched_signer_and_signature_variants) {
  auto ed_signer = lanebridge::schema::ed25519_signer_id_t{};
  ed_signer.public_key[0] = 1;
  auto secp_signature = lanebridge::schema::secp256k1_signature_t{};

  EXPECT_FALSE(lanebridge::crypto::verify_signature(
      lanebridge::schema::bytes_view_t{},
      lanebridge::schema::signer_id_t{ed_signer},
      lanebridge::schema::signature_t{secp_signature}));
}

TEST(crypto_verify, rejects_signature_without_recovery_id) {
  if (!lanebridge::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = make_secp_fixture();
  ASSERT_TRUE(fixture.has_value());
  fixture->signature[0] = 7;
  fixture->signature[64] = 7;

  EXPECT_FALSE(lanebridge::crypto::verify_signature(
      fixture->message, lanebridge::schema::signer_id_t{fixture->signer},
      lanebridge::schema::signature_t{fixture->signature}));
}

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif
