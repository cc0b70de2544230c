#pragma once
#include <lanebridge/schema/message_payload.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace lanebridge::schema {

void encode(const source_root_t& o, ::scale::Encoder& encoder);
void decode(source_root_t& o, ::scale::Decoder& decoder);

void encode(const source_account_t& o, ::scale::Encoder& encoder);
void decode(source_account_t& o, ::scale::Decoder& decoder);

void encode(const target_account_t& o, ::scale::Encoder& encoder);
void decode(target_account_t& o, ::scale::Decoder& decoder);

void encode(const call_t& o, ::scale::Encoder& encoder);
void decode(call_t& o, ::scale::Decoder& decoder);

void encode(const message_payload_t& o, ::scale::Encoder& encoder);
void decode(message_payload_t& o, ::scale::Decoder& decoder);

}  // namespace lanebridge::schema
