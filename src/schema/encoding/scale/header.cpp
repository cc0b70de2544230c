#include <lanebridge/schema/encoding/scale/header.hpp>

#include <scale/scale.hpp>

namespace lanebridge::schema {

void encode(const header_id_t& o, ::scale::Encoder& encoder) {
  encode(o.number, encoder);
  encode(o.hash, encoder);
}

void decode(header_id_t& o, ::scale::Decoder& decoder) {
  decode(o.number, decoder);
  decode(o.hash, decoder);
}

void encode(const pool_header_t& o, ::scale::Encoder& encoder) {
  encode(o.parent_hash, encoder);
  encode(o.number, encoder);
  encode(o.state_root, encoder);
}

void decode(pool_header_t& o, ::scale::Decoder& decoder) {
  decode(o.parent_hash, decoder);
  decode(o.number, decoder);
  decode(o.state_root, decoder);
}

void encode(const parachain_header_t& o, ::scale::Encoder& encoder) {
  encode(o.parent_hash, encoder);
  encode(o.number, encoder);
  encode(o.state_root, encoder);
  encode(o.extrinsics_root, encoder);
}

void decode(parachain_header_t& o, ::scale::Decoder& decoder) {
  decode(o.parent_hash, decoder);
  decode(o.number, decoder);
  decode(o.state_root, decoder);
  decode(o.extrinsics_root, decoder);
}

}  // namespace lanebridge::schema
