#pragma once
#include <lanebridge/schema/order.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace lanebridge::schema {

void encode(const priority_relayer_t& o, ::scale::Encoder& encoder);
void decode(priority_relayer_t& o, ::scale::Decoder& decoder);

void encode(const order<1>& o, ::scale::Encoder& encoder);
void decode(order<1>& o, ::scale::Decoder& decoder);

void encode(const relayer<1>& o, ::scale::Encoder& encoder);
void decode(relayer<1>& o, ::scale::Decoder& decoder);

void encode(const account_balance<1>& o, ::scale::Encoder& encoder);
void decode(account_balance<1>& o, ::scale::Decoder& decoder);

}  // namespace lanebridge::schema
