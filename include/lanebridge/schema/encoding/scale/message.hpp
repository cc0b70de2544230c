#pragma once
#include <lanebridge/schema/lane_data.hpp>
#include <lanebridge/schema/message.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace lanebridge::schema {

void encode(const message_key_t& o, ::scale::Encoder& encoder);
void decode(message_key_t& o, ::scale::Decoder& decoder);

void encode(const message_data_t& o, ::scale::Encoder& encoder);
void decode(message_data_t& o, ::scale::Decoder& decoder);

void encode(const message_t& o, ::scale::Encoder& encoder);
void decode(message_t& o, ::scale::Decoder& decoder);

void encode(const delivered_messages_t& o, ::scale::Encoder& encoder);
void decode(delivered_messages_t& o, ::scale::Decoder& decoder);

void encode(const unrewarded_relayer_t& o, ::scale::Encoder& encoder);
void decode(unrewarded_relayer_t& o, ::scale::Decoder& decoder);

void encode(const outbound_lane_data_t& o, ::scale::Encoder& encoder);
void decode(outbound_lane_data_t& o, ::scale::Decoder& decoder);

void encode(const inbound_lane_data_t& o, ::scale::Encoder& encoder);
void decode(inbound_lane_data_t& o, ::scale::Decoder& decoder);

}  // namespace lanebridge::schema
