#pragma once
#include <lanebridge/schema/header.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace lanebridge::schema {

void encode(const header_id_t& o, ::scale::Encoder& encoder);
void decode(header_id_t& o, ::scale::Decoder& decoder);

void encode(const pool_header_t& o, ::scale::Encoder& encoder);
void decode(pool_header_t& o, ::scale::Decoder& decoder);

void encode(const parachain_header_t& o, ::scale::Encoder& encoder);
void decode(parachain_header_t& o, ::scale::Decoder& decoder);

}  // namespace lanebridge::schema
