#pragma once
#include <lanebridge/schema/messages_proof.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace lanebridge::schema {

void encode(const messages_proof_t& o, ::scale::Encoder& encoder);
void decode(messages_proof_t& o, ::scale::Decoder& decoder);

void encode(const messages_delivery_proof_t& o, ::scale::Encoder& encoder);
void decode(messages_delivery_proof_t& o, ::scale::Decoder& decoder);

}  // namespace lanebridge::schema
