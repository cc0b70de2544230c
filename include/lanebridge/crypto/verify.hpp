#pragma once

#include <lanebridge/schema/primitives.hpp>

namespace lanebridge::crypto {

/// True when the linked OpenSSL exposes both ed25519 and secp256k1.
bool available();

/// Verify `signature` over `message` for the key in `signer`. Mismatched key
/// and signature schemes never verify.
bool verify_signature(const lanebridge::schema::bytes_view_t& message,
                      const lanebridge::schema::signer_id_t& signer,
                      const lanebridge::schema::signature_t& signature);

bool verify_ed25519(const lanebridge::schema::bytes_view_t& message,
                    const lanebridge::schema::ed25519_signer_id_t& signer,
                    const lanebridge::schema::ed25519_signature_t& signature);

/// ECDSA over sha256(message). The 65 byte signature carries a recovery id
/// either first ([v | r | s]) or last ([r | s | v]); it is not used.
bool verify_secp256k1(
    const lanebridge::schema::bytes_view_t& message,
    const lanebridge::schema::secp256k1_signer_id_t& signer,
    const lanebridge::schema::secp256k1_signature_t& signature);

}  // namespace lanebridge::crypto
