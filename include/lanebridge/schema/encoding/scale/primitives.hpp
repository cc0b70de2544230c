#pragma once
#include <lanebridge/schema/primitives.hpp>
#include <lanebridge/schema/weight.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Overloads live beside the types so that argument-dependent lookup from
// inside the scale library finds them for nested containers.
namespace lanebridge::schema {

/// amount_t is written as 32 little-endian bytes.
void encode_amount(const amount_t& value, ::scale::Encoder& encoder);
void decode_amount(amount_t& value, ::scale::Decoder& decoder);

void encode(const weight_t& o, ::scale::Encoder& encoder);
void decode(weight_t& o, ::scale::Decoder& decoder);

void encode(const ed25519_signer_id_t& o, ::scale::Encoder& encoder);
void decode(ed25519_signer_id_t& o, ::scale::Decoder& decoder);

void encode(const secp256k1_signer_id_t& o, ::scale::Encoder& encoder);
void decode(secp256k1_signer_id_t& o, ::scale::Decoder& decoder);

}  // namespace lanebridge::schema
