#pragma once

#include <lanebridge/schema/primitives.hpp>

#include <openssl/evp.h>

#include <array>
#include <memory>
#include <optional>

namespace lanebridge::testing {

/// Throwaway ed25519 key pair for signing test messages.
class ed25519_keypair final {
 public:
  static std::optional<ed25519_keypair> generate() {
    auto* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
    if (ctx == nullptr) {
      return std::nullopt;
    }
    auto* raw = static_cast<EVP_PKEY*>(nullptr);
    const auto ok =
        EVP_PKEY_keygen_init(ctx) == 1 && EVP_PKEY_keygen(ctx, &raw) == 1;
    EVP_PKEY_CTX_free(ctx);
    if (!ok) {
      return std::nullopt;
    }
    auto pair = ed25519_keypair{raw};
    auto size = pair.signer_.public_key.size();
    if (EVP_PKEY_get_raw_public_key(raw, pair.signer_.public_key.data(),
                                    &size) != 1 ||
        size != pair.signer_.public_key.size()) {
      return std::nullopt;
    }
    return pair;
  }

  const lanebridge::schema::ed25519_signer_id_t& signer() const {
    return signer_;
  }

  std::optional<lanebridge::schema::ed25519_signature_t> sign(
      const lanebridge::schema::bytes_view_t& message) const {
    auto* ctx = EVP_MD_CTX_new();
    if (ctx == nullptr) {
      return std::nullopt;
    }
    auto signature = lanebridge::schema::ed25519_signature_t{};
    auto size = signature.size();
    const auto ok =
        EVP_DigestSignInit(ctx, nullptr, nullptr, nullptr, key_.get()) == 1 &&
        EVP_DigestSign(ctx, signature.data(), &size, message.data(),
                       message.size()) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok || size != signature.size()) {
      return std::nullopt;
    }
    return signature;
  }

 private:
  struct key_deleter final {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
  };

  explicit ed25519_keypair(EVP_PKEY* key) : key_{key} {}

  std::unique_ptr<EVP_PKEY, key_deleter> key_;
  lanebridge::schema::ed25519_signer_id_t signer_{};
};

}  // namespace lanebridge::testing
