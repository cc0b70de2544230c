#pragma once

#include <lanebridge/schema/primitives.hpp>

#include <string_view>

// Schema key type: proved storage keys.
// Lane records are stored under the same keys that storage proofs open, so
// the state root of a pallet namespace covers them:
//   hash128(pallet) | hash128(map) | hash128(map_key) | map_key
namespace lanebridge::schema::key {

inline constexpr std::string_view kOutboundMessagesMap{"OutboundMessages"};
inline constexpr std::string_view kOutboundLanesMap{"OutboundLanes"};
inline constexpr std::string_view kInboundLanesMap{"InboundLanes"};
inline constexpr std::string_view kParasPallet{"Paras"};
inline constexpr std::string_view kParaHeadsMap{"Heads"};

/// Prefix shared by every key of the pallet namespace.
bytes_t pallet_prefix(std::string_view pallet);

/// Prefix shared by every key of one map of the pallet.
bytes_t map_prefix(std::string_view pallet, std::string_view map);

bytes_t storage_map_final_key(std::string_view pallet,
                              std::string_view map,
                              const bytes_view_t& map_key);

bytes_t outbound_message_key(std::string_view pallet,
                             const lane_id_t& lane,
                             message_nonce_t nonce);

bytes_t outbound_lane_data_key(std::string_view pallet, const lane_id_t& lane);

bytes_t inbound_lane_data_key(std::string_view pallet, const lane_id_t& lane);

/// Key of a parachain head in the relay chain state.
bytes_t parachain_head_key(uint32_t para_id);

}  // namespace lanebridge::schema::key
