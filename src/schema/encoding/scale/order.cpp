#include <lanebridge/schema/encoding/scale/order.hpp>
#include <lanebridge/schema/encoding/scale/primitives.hpp>

#include <scale/scale.hpp>

namespace lanebridge::schema {

void encode(const priority_relayer_t& o, ::scale::Encoder& encoder) {
  encode(o.id, encoder);
  encode_amount(o.fee, encoder);
  encode(o.valid_range_start, encoder);
  encode(o.valid_range_end, encoder);
}

void decode(priority_relayer_t& o, ::scale::Decoder& decoder) {
  decode(o.id, decoder);
  decode_amount(o.fee, decoder);
  decode(o.valid_range_start, decoder);
  decode(o.valid_range_end, decoder);
}

void encode(const order<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.lane, encoder);
  encode(o.nonce, encoder);
  encode_amount(o.fee, encoder);
  encode(o.sent_time, encoder);
  encode(o.confirm_time, encoder);
  encode(o.relayers, encoder);
  encode_amount(o.locked_collateral, encoder);
}

void decode(order<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.lane, decoder);
  decode(o.nonce, decoder);
  decode_amount(o.fee, decoder);
  decode(o.sent_time, decoder);
  decode(o.confirm_time, decoder);
  decode(o.relayers, decoder);
  decode_amount(o.locked_collateral, decoder);
}

void encode(const relayer<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode_amount(o.collateral, encoder);
  encode_amount(o.fee, encoder);
  encode(o.enrolled_at, encoder);
}

void decode(relayer<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode_amount(o.collateral, decoder);
  decode_amount(o.fee, decoder);
  decode(o.enrolled_at, decoder);
}

void encode(const account_balance<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode_amount(o.free, encoder);
  encode_amount(o.locked, encoder);
}

void decode(account_balance<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode_amount(o.free, decoder);
  decode_amount(o.locked, decoder);
}

}  // namespace lanebridge::schema
