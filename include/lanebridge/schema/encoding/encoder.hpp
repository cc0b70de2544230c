#pragma once
#include <lanebridge/schema/primitives.hpp>
#include <optional>
#include <span>

namespace lanebridge::schema::encoding {

/// Codec front end selected at build time by tag (see scale/encoder.hpp).
///
/// `decode` treats malformed input as a fault and stops the process; use
/// `try_decode` for anything that arrived from outside (proofs, payloads).
template <typename Library>
struct encoder {
  template <typename T>
  lanebridge::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, lanebridge::schema::bytes_t& out);

  template <typename T>
  T decode(const lanebridge::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const lanebridge::schema::bytes_view_t& bytes);
};

}  // namespace lanebridge::schema::encoding
