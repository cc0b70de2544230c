#include <lanebridge/blake3/hash.hpp>
#include <lanebridge/dispatch/origin.hpp>
#include <lanebridge/schema/encoding/scale/encoder.hpp>
#include <lanebridge/schema/key/builder.hpp>

#include <variant>

namespace lanebridge::dispatch {

lanebridge::schema::account_id_t derive_source_root_account(
    const lanebridge::schema::chain_id_t& source_chain) {
  auto key = lanebridge::schema::key::builder{};
  key.write(kRootAccountDerivationPrefix).write(source_chain);
  return key.digest();
}

lanebridge::schema::account_id_t derive_source_account(
    const lanebridge::schema::chain_id_t& source_chain,
    const lanebridge::schema::account_id_t& id) {
  auto key = lanebridge::schema::key::builder{};
  key.write(kAccountDerivationPrefix).write(source_chain).write(id);
  return key.digest();
}

lanebridge::schema::account_id_t derive_target_account(
    const lanebridge::schema::signer_id_t& public_key) {
  return std::visit(
      overloaded{
          [](const lanebridge::schema::ed25519_signer_id_t& signer) {
            return lanebridge::schema::account_id_t{signer.public_key};
          },
          [](const lanebridge::schema::secp256k1_signer_id_t& signer) {
            return lanebridge::blake3::hash(signer.public_key);
          }},
      public_key);
}

lanebridge::schema::hash32_t ownership_digest(
    const lanebridge::schema::bytes_view_t& encoded_call,
    const lanebridge::schema::account_id_t& source_id,
    const uint32_t spec_version,
    const lanebridge::schema::chain_id_t& source_chain,
    const lanebridge::schema::chain_id_t& target_chain) {
  auto key = lanebridge::schema::key::builder{};
  key.write(encoded_call)
      .write(source_id)
      .write(spec_version)
      .write(source_chain)
      .write(target_chain);
  return key.digest();
}

bool verify_message_origin(const lanebridge::schema::local_origin_t& submitter,
                           const lanebridge::schema::message_payload_t& payload) {
  const auto* signed_submitter =
      std::get_if<lanebridge::schema::signed_origin_t>(&submitter);
  const auto is_root =
      std::holds_alternative<lanebridge::schema::root_origin_t>(submitter);

  return std::visit(
      overloaded{
          [&](const lanebridge::schema::source_root_t&) { return is_root; },
          [&](const lanebridge::schema::target_account_t& origin) {
            return signed_submitter != nullptr &&
                   signed_submitter->account == origin.source_id;
          },
          [&](const lanebridge::schema::source_account_t& origin) {
            return is_root || (signed_submitter != nullptr &&
                               signed_submitter->account == origin.id);
          }},
      payload.origin);
}

}  // namespace lanebridge::dispatch
