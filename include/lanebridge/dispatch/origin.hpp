#pragma once

#include <lanebridge/schema/message_payload.hpp>
#include <lanebridge/schema/primitives.hpp>

#include <cstdint>
#include <string_view>

namespace lanebridge::dispatch {

inline constexpr std::string_view kRootAccountDerivationPrefix{
    "lanebridge/account-derivation/root"};
inline constexpr std::string_view kAccountDerivationPrefix{
    "lanebridge/account-derivation/account"};

/// Account that acts for the bridged chain's privileged origin.
lanebridge::schema::account_id_t derive_source_root_account(
    const lanebridge::schema::chain_id_t& source_chain);

/// Account that acts for `id` of the bridged chain. Never collides with a
/// native account.
lanebridge::schema::account_id_t derive_source_account(
    const lanebridge::schema::chain_id_t& source_chain,
    const lanebridge::schema::account_id_t& id);

/// Native account controlled by `public_key`.
lanebridge::schema::account_id_t derive_target_account(
    const lanebridge::schema::signer_id_t& public_key);

/// Digest a TargetAccount origin must sign to prove that the owner of
/// `source_id` also controls the target key.
lanebridge::schema::hash32_t ownership_digest(
    const lanebridge::schema::bytes_view_t& encoded_call,
    const lanebridge::schema::account_id_t& source_id,
    uint32_t spec_version,
    const lanebridge::schema::chain_id_t& source_chain,
    const lanebridge::schema::chain_id_t& target_chain);

/// Who may submit a message that claims `payload.origin`:
///   SourceRoot      root only,
///   TargetAccount   the signed account equal to source_id,
///   SourceAccount   the signed account equal to id, or root.
bool verify_message_origin(const lanebridge::schema::local_origin_t& submitter,
                           const lanebridge::schema::message_payload_t& payload);

}  // namespace lanebridge::dispatch
