#include <lanebridge/schema/encoding/scale/primitives.hpp>

#include <array>
#include <iterator>
#include <scale/scale.hpp>
#include <stdexcept>
#include <vector>

namespace lanebridge::schema {

void encode_amount(const amount_t& value, ::scale::Encoder& encoder) {
  auto little_endian = std::vector<uint8_t>{};
  boost::multiprecision::export_bits(value, std::back_inserter(little_endian),
                                     8, false);
  auto fixed = std::array<uint8_t, 32>{};
  for (std::size_t i = 0; i < little_endian.size() && i < fixed.size(); ++i) {
    fixed[i] = little_endian[i];
  }
  encode(fixed, encoder);
}

void decode_amount(amount_t& value, ::scale::Decoder& decoder) {
  auto fixed = std::array<uint8_t, 32>{};
  decode(fixed, decoder);
  value = amount_t{0};
  boost::multiprecision::import_bits(value, std::begin(fixed), std::end(fixed),
                                     8, false);
}

void encode(const weight_t& o, ::scale::Encoder& encoder) {
  encode(o.ref_time(), encoder);
}

void decode(weight_t& o, ::scale::Decoder& decoder) {
  auto ref_time = uint64_t{};
  decode(ref_time, decoder);
  o = weight_t{ref_time};
}

void encode(const ed25519_signer_id_t& o, ::scale::Encoder& encoder) {
  encode(o.public_key, encoder);
}

void decode(ed25519_signer_id_t& o, ::scale::Decoder& decoder) {
  decode(o.public_key, decoder);
}

void encode(const secp256k1_signer_id_t& o, ::scale::Encoder& encoder) {
  encode(o.public_key, encoder);
}

void decode(secp256k1_signer_id_t& o, ::scale::Decoder& decoder) {
  decode(o.public_key, decoder);
  if (o.public_key[0] != 0x02 && o.public_key[0] != 0x03) {
    throw std::invalid_argument{"secp256k1 key is not compressed"};
  }
}

}  // namespace lanebridge::schema
