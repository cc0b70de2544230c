#include <lanebridge/schema/encoding/scale/message.hpp>
#include <lanebridge/schema/encoding/scale/messages_proof.hpp>

#include <scale/scale.hpp>

namespace lanebridge::schema {

void encode(const messages_proof_t& o, ::scale::Encoder& encoder) {
  encode(o.finalized_header_hash, encoder);
  encode(o.storage_proof, encoder);
  encode(o.lane, encoder);
  encode(o.nonces_start, encoder);
  encode(o.nonces_end, encoder);
}

void decode(messages_proof_t& o, ::scale::Decoder& decoder) {
  decode(o.finalized_header_hash, decoder);
  decode(o.storage_proof, decoder);
  decode(o.lane, decoder);
  decode(o.nonces_start, decoder);
  decode(o.nonces_end, decoder);
}

void encode(const messages_delivery_proof_t& o, ::scale::Encoder& encoder) {
  encode(o.finalized_header_hash, encoder);
  encode(o.storage_proof, encoder);
  encode(o.lane, encoder);
}

void decode(messages_delivery_proof_t& o, ::scale::Decoder& decoder) {
  decode(o.finalized_header_hash, decoder);
  decode(o.storage_proof, decoder);
  decode(o.lane, decoder);
}

}  // namespace lanebridge::schema
