#pragma once

#include <lanebridge/schema/bridge_error_code.hpp>
#include <lanebridge/schema/encoding/scale/encoder.hpp>
#include <lanebridge/schema/lane_data.hpp>
#include <lanebridge/schema/message.hpp>
#include <lanebridge/schema/primitives.hpp>
#include <lanebridge/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lanebridge::lane {

/// Source side of one lane: nonce generation, delivery confirmation and
/// pruning. Records live under the pallet's proof keys.
class outbound_lane final {
 public:
  outbound_lane(lanebridge::schema::encoding::scale_encoder_t& encoder,
                lanebridge::storage::rocksdb_storage_t& storage,
                std::string_view pallet,
                const lanebridge::schema::lane_id_t& lane);

  lanebridge::schema::outbound_lane_data_t data() const;

  /// Store the message under the next nonce and return that nonce.
  lanebridge::schema::message_nonce_t send_message(
      const lanebridge::schema::message_data_t& message);

  std::optional<lanebridge::schema::message_data_t> message(
      lanebridge::schema::message_nonce_t nonce) const;

  /// Apply a proved inbound lane state. Returns the newly confirmed range;
  /// nullopt with `error == ok` means there was nothing new to confirm.
  std::optional<lanebridge::schema::delivered_messages_t> confirm_delivery(
      uint64_t max_allowed_messages,
      lanebridge::schema::message_nonce_t latest_delivered_nonce,
      const std::vector<lanebridge::schema::unrewarded_relayer_t>& relayers,
      lanebridge::schema::bridge_error_code_t& error);

  /// Remove up to `max_messages` confirmed messages for which `settled`
  /// holds, oldest first. Returns the number removed.
  uint64_t prune_messages(
      uint64_t max_messages,
      const std::function<bool(lanebridge::schema::message_nonce_t)>& settled);

  const lanebridge::schema::lane_id_t& id() const { return lane_; }

 private:
  void store(const lanebridge::schema::outbound_lane_data_t& data);

  lanebridge::schema::encoding::scale_encoder_t& encoder_;
  lanebridge::storage::rocksdb_storage_t& storage_;
  std::string pallet_;
  lanebridge::schema::lane_id_t lane_;
};

}  // namespace lanebridge::lane
