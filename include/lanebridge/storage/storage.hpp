#pragma once
#include <lanebridge/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace lanebridge::storage {

using key_value_entry_t =
    std::pair<lanebridge::schema::bytes_t, lanebridge::schema::bytes_t>;

/// Owned key/value store handle. Ledgers receive it by reference and are
/// the only code that mutates the records they own.
template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const lanebridge::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const lanebridge::schema::bytes_view_t& key,
           const T& value) const;

  /// Remove key; missing keys are ignored.
  void erase(const lanebridge::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const lanebridge::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace lanebridge::storage
