#pragma once
#include <lanebridge/common/critical.hpp>
#include <lanebridge/schema/encoding/encoder.hpp>
#include <lanebridge/schema/encoding/scale/header.hpp>
#include <lanebridge/schema/encoding/scale/message.hpp>
#include <lanebridge/schema/encoding/scale/message_payload.hpp>
#include <lanebridge/schema/encoding/scale/messages_proof.hpp>
#include <lanebridge/schema/encoding/scale/order.hpp>
#include <lanebridge/schema/encoding/scale/primitives.hpp>
#include <exception>
#include <iterator>
#include <scale/scale.hpp>
#include <spdlog/spdlog.h>

namespace lanebridge::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  lanebridge::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, lanebridge::schema::bytes_t& out);

  template <typename T>
  T decode(const lanebridge::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const lanebridge::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
lanebridge::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    lanebridge::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        lanebridge::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const lanebridge::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    lanebridge::common::critical("failed to decode SCALE bytes");
  }
  return std::move(decoded.value());
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const lanebridge::schema::bytes_view_t& bytes) {
  try {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return std::move(decoded.value());
  } catch (const std::exception& e) {
    spdlog::debug("SCALE decode rejected input: {}", e.what());
    return std::nullopt;
  }
}

}  // namespace lanebridge::schema::encoding
