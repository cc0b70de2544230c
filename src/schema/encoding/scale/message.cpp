#include <lanebridge/schema/encoding/scale/message.hpp>
#include <lanebridge/schema/encoding/scale/primitives.hpp>

#include <scale/scale.hpp>

namespace lanebridge::schema {

void encode(const message_key_t& o, ::scale::Encoder& encoder) {
  encode(o.lane, encoder);
  encode(o.nonce, encoder);
}

void decode(message_key_t& o, ::scale::Decoder& decoder) {
  decode(o.lane, decoder);
  decode(o.nonce, decoder);
}

void encode(const message_data_t& o, ::scale::Encoder& encoder) {
  encode_amount(o.fee, encoder);
  encode(o.payload, encoder);
}

void decode(message_data_t& o, ::scale::Decoder& decoder) {
  decode_amount(o.fee, decoder);
  decode(o.payload, decoder);
}

void encode(const message_t& o, ::scale::Encoder& encoder) {
  encode(o.key, encoder);
  encode(o.data, encoder);
}

void decode(message_t& o, ::scale::Decoder& decoder) {
  decode(o.key, decoder);
  decode(o.data, decoder);
}

void encode(const delivered_messages_t& o, ::scale::Encoder& encoder) {
  encode(o.begin, encoder);
  encode(o.end, encoder);
}

void decode(delivered_messages_t& o, ::scale::Decoder& decoder) {
  decode(o.begin, decoder);
  decode(o.end, decoder);
}

void encode(const unrewarded_relayer_t& o, ::scale::Encoder& encoder) {
  encode(o.relayer, encoder);
  encode(o.messages, encoder);
}

void decode(unrewarded_relayer_t& o, ::scale::Decoder& decoder) {
  decode(o.relayer, decoder);
  decode(o.messages, decoder);
}

void encode(const outbound_lane_data_t& o, ::scale::Encoder& encoder) {
  encode(o.oldest_unpruned_nonce, encoder);
  encode(o.latest_received_nonce, encoder);
  encode(o.latest_generated_nonce, encoder);
}

void decode(outbound_lane_data_t& o, ::scale::Decoder& decoder) {
  decode(o.oldest_unpruned_nonce, decoder);
  decode(o.latest_received_nonce, decoder);
  decode(o.latest_generated_nonce, decoder);
}

void encode(const inbound_lane_data_t& o, ::scale::Encoder& encoder) {
  encode(o.relayers, encoder);
  encode(o.last_confirmed_nonce, encoder);
}

void decode(inbound_lane_data_t& o, ::scale::Decoder& decoder) {
  decode(o.relayers, decoder);
  decode(o.last_confirmed_nonce, decoder);
}

}  // namespace lanebridge::schema
