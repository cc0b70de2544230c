#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <spdlog/spdlog.h>
#include <lanebridge/common/critical.hpp>
#include <lanebridge/storage/storage.hpp>
#include <memory>
#include <string_view>

namespace lanebridge::storage {

namespace detail {

inline lanebridge::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const lanebridge::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const lanebridge::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const lanebridge::schema::bytes_view_t& key,
           const T& value) const;

  void erase(const lanebridge::schema::bytes_view_t& key) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const lanebridge::schema::bytes_view_t& prefix) const;

  /// Open database; stops the process when the store was never opened or
  /// has been released.
  ROCKSDB_NAMESPACE::DB& handle() const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const lanebridge::schema::bytes_view_t& key) const {
  auto value = std::string{};
  auto status = handle().Get(ROCKSDB_NAMESPACE::ReadOptions{},
                             detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    lanebridge::common::critical("RocksDB get failed: {}", status.ToString());
  }
  return {encoder.template decode<T>(lanebridge::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const lanebridge::schema::bytes_view_t& key,
    const T& value) const {
  auto encoded_value = encoder.encode(value);
  auto status = handle().Put(ROCKSDB_NAMESPACE::WriteOptions{},
                             detail::to_slice(key),
                             detail::to_slice(encoded_value));
  if (!status.ok()) {
    lanebridge::common::critical("RocksDB put failed: {}", status.ToString());
  }
}

inline void storage<rocksdb_storage_tag>::erase(
    const lanebridge::schema::bytes_view_t& key) const {
  auto status =
      handle().Delete(ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key));
  if (!status.ok()) {
    lanebridge::common::critical("RocksDB delete failed: {}", status.ToString());
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const lanebridge::schema::bytes_view_t& prefix) const {
  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_view = std::string_view{
      reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      handle().NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(detail::to_slice(prefix));
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_view)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    lanebridge::common::critical("RocksDB scan failed: {}",
                                 iterator->status().ToString());
  }
  return entries;
}

}  // namespace lanebridge::storage
