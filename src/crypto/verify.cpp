#include <lanebridge/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <vector>

namespace lanebridge::crypto {

namespace {

template <typename T, void (*Free)(T*)>
struct openssl_deleter final {
  void operator()(T* value) const { Free(value); }
};

using pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, openssl_deleter<EVP_PKEY_CTX, EVP_PKEY_CTX_free>>;
using pkey_ptr = std::unique_ptr<EVP_PKEY, openssl_deleter<EVP_PKEY, EVP_PKEY_free>>;
using md_ctx_ptr =
    std::unique_ptr<EVP_MD_CTX, openssl_deleter<EVP_MD_CTX, EVP_MD_CTX_free>>;
using ecdsa_sig_ptr =
    std::unique_ptr<ECDSA_SIG, openssl_deleter<ECDSA_SIG, ECDSA_SIG_free>>;
using bignum_ptr = std::unique_ptr<BIGNUM, openssl_deleter<BIGNUM, BN_free>>;

bool is_recovery_id(const uint8_t value) {
  return value <= 3 || value >= 27;
}

// A recovery id byte may lead or trail the (r, s) pair. When both ends look
// like one, both layouts are candidates.
std::vector<std::array<uint8_t, 64>> compact_candidates(
    const lanebridge::schema::secp256k1_signature_t& signature) {
  auto out = std::vector<std::array<uint8_t, 64>>{};
  if (is_recovery_id(signature.front())) {
    auto& compact = out.emplace_back();
    std::copy_n(signature.begin() + 1, compact.size(), compact.begin());
  }
  if (is_recovery_id(signature.back())) {
    auto& compact = out.emplace_back();
    std::copy_n(signature.begin(), compact.size(), compact.begin());
  }
  return out;
}

pkey_ptr secp256k1_public_key(
    const lanebridge::schema::secp256k1_signer_id_t& signer) {
  auto ctx = pkey_ctx_ptr{EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr)};
  if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
    return nullptr;
  }
  char group_name[] = "secp256k1";
  auto public_key = signer.public_key;
  auto params = std::array{
      OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME, group_name,
                                       0),
      OSSL_PARAM_construct_octet_string(OSSL_PKEY_PARAM_PUB_KEY,
                                        public_key.data(), public_key.size()),
      OSSL_PARAM_construct_end()};
  auto* raw = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(ctx.get(), &raw, EVP_PKEY_PUBLIC_KEY, params.data()) !=
      1) {
    return nullptr;
  }
  return pkey_ptr{raw};
}

std::optional<std::vector<uint8_t>> der_signature(
    const std::array<uint8_t, 64>& compact) {
  auto signature = ecdsa_sig_ptr{ECDSA_SIG_new()};
  auto r = bignum_ptr{BN_bin2bn(compact.data(), 32, nullptr)};
  auto s = bignum_ptr{BN_bin2bn(compact.data() + 32, 32, nullptr)};
  if (!signature || !r || !s ||
      ECDSA_SIG_set0(signature.get(), r.get(), s.get()) != 1) {
    return std::nullopt;
  }
  // ECDSA_SIG owns r and s from here on.
  static_cast<void>(r.release());
  static_cast<void>(s.release());

  auto size = i2d_ECDSA_SIG(signature.get(), nullptr);
  if (size <= 0) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(static_cast<std::size_t>(size));
  auto* cursor = der.data();
  if (i2d_ECDSA_SIG(signature.get(), &cursor) != size) {
    return std::nullopt;
  }
  return der;
}

}  // namespace

bool available() {
  static const auto supported = [] {
    auto ed25519 = pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr)};
    auto ec = pkey_ctx_ptr{EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr)};
    return ed25519 != nullptr && ec != nullptr;
  }();
  return supported;
}

bool verify_ed25519(const lanebridge::schema::bytes_view_t& message,
                    const lanebridge::schema::ed25519_signer_id_t& signer,
                    const lanebridge::schema::ed25519_signature_t& signature) {
  auto key = pkey_ptr{EVP_PKEY_new_raw_public_key(
      EVP_PKEY_ED25519, nullptr, signer.public_key.data(),
      signer.public_key.size())};
  auto ctx = md_ctx_ptr{EVP_MD_CTX_new()};
  if (!key || !ctx) {
    return false;
  }
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) !=
      1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
}

bool verify_secp256k1(
    const lanebridge::schema::bytes_view_t& message,
    const lanebridge::schema::secp256k1_signer_id_t& signer,
    const lanebridge::schema::secp256k1_signature_t& signature) {
  const auto candidates = compact_candidates(signature);
  if (candidates.empty()) {
    return false;
  }
  auto key = secp256k1_public_key(signer);
  if (!key) {
    return false;
  }
  return std::ranges::any_of(candidates, [&](const auto& compact) {
    auto der = der_signature(compact);
    auto ctx = md_ctx_ptr{EVP_MD_CTX_new()};
    if (!der || !ctx) {
      return false;
    }
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                             key.get()) != 1) {
      return false;
    }
    return EVP_DigestVerify(ctx.get(), der->data(), der->size(),
                            message.data(), message.size()) == 1;
  });
}

bool verify_signature(const lanebridge::schema::bytes_view_t& message,
                      const lanebridge::schema::signer_id_t& signer,
                      const lanebridge::schema::signature_t& signature) {
  return std::visit(
      overloaded{
          [&](const lanebridge::schema::ed25519_signer_id_t& key,
              const lanebridge::schema::ed25519_signature_t& value) {
            return verify_ed25519(message, key, value);
          },
          [&](const lanebridge::schema::secp256k1_signer_id_t& key,
              const lanebridge::schema::secp256k1_signature_t& value) {
            return verify_secp256k1(message, key, value);
          },
          [](const auto&, const auto&) { return false; }},
      signer, signature);
}

}  // namespace lanebridge::crypto
