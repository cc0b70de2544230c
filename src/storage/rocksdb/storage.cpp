#include <lanebridge/common/critical.hpp>
#include <lanebridge/storage/rocksdb/storage.hpp>

namespace lanebridge::storage {

namespace {

ROCKSDB_NAMESPACE::Options make_options() {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  // Lane records and orders are small; proofs re-read a pallet by prefix.
  options.OptimizeForSmallDb();
  options.IncreaseParallelism();
  return options;
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto* database = static_cast<ROCKSDB_NAMESPACE::DB*>(nullptr);
  const auto status =
      ROCKSDB_NAMESPACE::DB::Open(make_options(), std::string{path}, &database);
  if (!status.ok()) {
    lanebridge::common::critical("Cannot open lane store at {}: {}", path,
                                 status.ToString());
  }
  spdlog::debug("Lane store open at {}", path);

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);
  return store;
}

ROCKSDB_NAMESPACE::DB& storage<rocksdb_storage_tag>::handle() const {
  if (!database) {
    lanebridge::common::critical("Lane store used after it was closed");
  }
  return *database;
}

}  // namespace lanebridge::storage
