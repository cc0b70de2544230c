#pragma once

#include <lanebridge/dispatch/call_runtime.hpp>
#include <lanebridge/proof/finality_source.hpp>
#include <lanebridge/schema/encoding/scale/encoder.hpp>
#include <lanebridge/schema/message_payload.hpp>
#include <lanebridge/schema/primitives.hpp>
#include <lanebridge/storage/rocksdb/storage.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace lanebridge::testing {

using scale_encoder_t = lanebridge::schema::encoding::scale_encoder_t;

inline lanebridge::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = lanebridge::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline lanebridge::schema::account_id_t make_account(const uint8_t seed) {
  auto out = lanebridge::schema::account_id_t{};
  out[0] = seed;
  out[31] = 0xA5;
  return out;
}

inline lanebridge::schema::lane_id_t make_lane(const uint8_t seed) {
  return lanebridge::schema::lane_id_t{0x00, 0x00, 0x00, seed};
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Scratch RocksDB directory removed when the fixture goes away.
class storage_fixture final {
 public:
  explicit storage_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)},
        storage_{lanebridge::storage::make_storage<
            lanebridge::storage::rocksdb_storage_tag>(db_path_)} {}

  storage_fixture(const storage_fixture&) = delete;
  storage_fixture& operator=(const storage_fixture&) = delete;

  ~storage_fixture() {
    storage_.database.reset();
    remove_path(db_path_);
  }

  scale_encoder_t& encoder() { return encoder_; }
  lanebridge::storage::rocksdb_storage_t& storage() { return storage_; }
  const std::string& db_path() const { return db_path_; }

 private:
  std::string db_path_;
  scale_encoder_t encoder_;
  lanebridge::storage::rocksdb_storage_t storage_;
};

/// Finality source backed by a plain map of header hash to state root.
class static_finality final : public lanebridge::proof::finality_source {
 public:
  void add(const lanebridge::schema::hash32_t& header_hash,
           const lanebridge::schema::hash32_t& state_root) {
    roots_.insert_or_assign(header_hash, state_root);
  }

  std::optional<lanebridge::schema::hash32_t> finalized_state_root(
      const lanebridge::schema::hash32_t& header_hash) const override {
    auto it = roots_.find(header_hash);
    if (it == roots_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

 private:
  std::map<lanebridge::schema::hash32_t, lanebridge::schema::hash32_t> roots_;
};

/// Call runtime that records what it executed. Every call costs
/// `minimal` and reports `actual` once executed.
class recording_runtime final : public lanebridge::dispatch::call_runtime {
 public:
  lanebridge::schema::weight_t minimal{100};
  std::optional<lanebridge::schema::weight_t> actual;
  bool succeed{true};
  std::vector<std::pair<lanebridge::schema::account_id_t,
                        lanebridge::schema::call_t>>
      executed;

  lanebridge::schema::weight_t minimal_weight(
      const lanebridge::schema::call_t&) const override {
    return minimal;
  }

  lanebridge::dispatch::call_outcome_t execute(
      const lanebridge::schema::account_id_t& origin,
      const lanebridge::schema::call_t& call) override {
    executed.emplace_back(origin, call);
    auto outcome = lanebridge::dispatch::call_outcome_t{};
    outcome.success = succeed;
    outcome.actual_weight = actual;
    if (!succeed) {
      outcome.error = "call reverted";
    }
    return outcome;
  }
};

inline lanebridge::schema::bytes_t make_call(scale_encoder_t& encoder,
                                             const uint8_t call_index = 1) {
  return encoder.encode(lanebridge::schema::call_t{
      0x04, call_index, lanebridge::schema::bytes_t{0xDE, 0xAD}});
}

inline lanebridge::schema::message_payload_t make_payload(
    scale_encoder_t& encoder,
    const uint32_t spec_version,
    lanebridge::schema::call_origin_t origin,
    const uint64_t weight = 1'000) {
  auto payload = lanebridge::schema::message_payload_t{};
  payload.spec_version = spec_version;
  payload.weight = lanebridge::schema::weight_t{weight};
  payload.origin = std::move(origin);
  payload.call = make_call(encoder);
  return payload;
}

}  // namespace lanebridge::testing
