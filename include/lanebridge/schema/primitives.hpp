#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lanebridge::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = hash32_t;
using amount_t = boost::multiprecision::uint256_t;
using block_number_t = uint64_t;
using message_nonce_t = uint64_t;

/// Opaque channel identifier shared by both ends of a lane.
using lane_id_t = std::array<uint8_t, 4>;

/// Identifier of a bridged chain (used in origin derivation and events).
using chain_id_t = std::array<uint8_t, 4>;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_view_t& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

std::optional<lane_id_t> try_make_lane_id(const std::string_view& hex);
std::optional<chain_id_t> try_make_chain_id(const std::string_view& hex);

/// Decimal digits only.
std::optional<amount_t> try_make_amount(const std::string_view& decimal);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(const std::string_view hex);

struct ed25519_signer_id final {
  std::array<uint8_t, 32> public_key;
};

struct secp256k1_signer_id final {
  std::array<uint8_t, 33> public_key;
};

using ed25519_signer_id_t = ed25519_signer_id;
using secp256k1_signer_id_t = secp256k1_signer_id;
using signer_id_t = std::variant<ed25519_signer_id_t, secp256k1_signer_id_t>;

using ed25519_signature_t = std::array<uint8_t, 64>;
using secp256k1_signature_t = std::array<uint8_t, 65>;
using signature_t = std::variant<ed25519_signature_t, secp256k1_signature_t>;

inline bool operator==(const ed25519_signer_id& lhs,
                       const ed25519_signer_id& rhs) {
  return lhs.public_key == rhs.public_key;
}

inline bool operator==(const secp256k1_signer_id& lhs,
                       const secp256k1_signer_id& rhs) {
  return lhs.public_key == rhs.public_key;
}

}  // namespace lanebridge::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
