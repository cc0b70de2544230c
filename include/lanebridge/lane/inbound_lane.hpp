#pragma once

#include <lanebridge/dispatch/dispatcher.hpp>
#include <lanebridge/schema/bridge_error_code.hpp>
#include <lanebridge/schema/dispatch_event.hpp>
#include <lanebridge/schema/encoding/scale/encoder.hpp>
#include <lanebridge/schema/lane_data.hpp>
#include <lanebridge/schema/message.hpp>
#include <lanebridge/schema/primitives.hpp>
#include <lanebridge/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lanebridge::lane {

struct receive_result final {
  /// One per delivered nonce, in nonce order.
  std::vector<lanebridge::schema::dispatch_event_t> events;
  lanebridge::schema::lane_advance_t advance;
};

using receive_result_t = receive_result;

/// Target side of one lane. Accepts only the contiguous range that starts
/// right after `last_confirmed_nonce` and remembers who delivered it.
class inbound_lane final {
 public:
  inbound_lane(lanebridge::schema::encoding::scale_encoder_t& encoder,
               lanebridge::storage::rocksdb_storage_t& storage,
               std::string_view pallet,
               const lanebridge::schema::lane_id_t& lane,
               uint64_t max_unrewarded_relayers);

  lanebridge::schema::inbound_lane_data_t data() const;

  /// Drop relayer entries the source chain has already confirmed. Returns
  /// the number of entries removed.
  std::size_t receive_state_update(
      lanebridge::schema::message_nonce_t latest_received_nonce);

  /// Dispatch `messages` (already proved, ordered by nonce) and advance the
  /// lane. A source lane state carried by the same proof is applied first.
  /// A rejected range dispatches nothing and leaves the stored lane as it
  /// was, state update included.
  std::optional<receive_result_t> receive_messages(
      const lanebridge::schema::account_id_t& relayer,
      const std::vector<lanebridge::schema::message_t>& messages,
      lanebridge::dispatch::dispatcher& dispatcher,
      lanebridge::schema::bridge_error_code_t& error,
      std::optional<lanebridge::schema::message_nonce_t> latest_received_nonce =
          std::nullopt);

  const lanebridge::schema::lane_id_t& id() const { return lane_; }

 private:
  std::size_t trim_confirmed(
      lanebridge::schema::inbound_lane_data_t& lane_data,
      lanebridge::schema::message_nonce_t latest_received_nonce,
      bool& changed) const;

  void store(const lanebridge::schema::inbound_lane_data_t& data);

  lanebridge::schema::encoding::scale_encoder_t& encoder_;
  lanebridge::storage::rocksdb_storage_t& storage_;
  std::string pallet_;
  lanebridge::schema::lane_id_t lane_;
  uint64_t max_unrewarded_relayers_{};
};

}  // namespace lanebridge::lane
