#include <lanebridge/schema/encoding/scale/message_payload.hpp>
#include <lanebridge/schema/encoding/scale/primitives.hpp>

#include <scale/scale.hpp>
#include <stdexcept>

namespace lanebridge::schema {

void encode(const source_root_t&, ::scale::Encoder&) {}

void decode(source_root_t&, ::scale::Decoder&) {}

void encode(const source_account_t& o, ::scale::Encoder& encoder) {
  encode(o.id, encoder);
}

void decode(source_account_t& o, ::scale::Decoder& decoder) {
  decode(o.id, decoder);
}

void encode(const target_account_t& o, ::scale::Encoder& encoder) {
  encode(o.source_id, encoder);
  encode(o.target_public, encoder);
  encode(o.signature, encoder);
}

void decode(target_account_t& o, ::scale::Decoder& decoder) {
  decode(o.source_id, decoder);
  decode(o.target_public, decoder);
  decode(o.signature, decoder);
}

void encode(const call_t& o, ::scale::Encoder& encoder) {
  encode(o.module_index, encoder);
  encode(o.call_index, encoder);
  encode(o.arguments, encoder);
}

void decode(call_t& o, ::scale::Decoder& decoder) {
  decode(o.module_index, decoder);
  decode(o.call_index, decoder);
  decode(o.arguments, decoder);
}

void encode(const message_payload_t& o, ::scale::Encoder& encoder) {
  encode(o.spec_version, encoder);
  encode(o.weight, encoder);
  encode(o.origin, encoder);
  encode(static_cast<uint8_t>(o.dispatch_fee_payment), encoder);
  encode(o.call, encoder);
}

void decode(message_payload_t& o, ::scale::Decoder& decoder) {
  decode(o.spec_version, decoder);
  decode(o.weight, decoder);
  decode(o.origin, decoder);
  auto fee_payment = uint8_t{};
  decode(fee_payment, decoder);
  if (fee_payment > static_cast<uint8_t>(dispatch_fee_payment_t::at_target_chain)) {
    throw std::invalid_argument{"unknown dispatch fee payment"};
  }
  o.dispatch_fee_payment = static_cast<dispatch_fee_payment_t>(fee_payment);
  decode(o.call, decoder);
}

}  // namespace lanebridge::schema
