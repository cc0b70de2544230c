#include <lanebridge/schema/key/builder.hpp>
#include <lanebridge/schema/key/storage_keys.hpp>

namespace lanebridge::schema::key {

bytes_t pallet_prefix(const std::string_view pallet) {
  auto b = builder{};
  b.hash128(pallet);
  return b.data;
}

bytes_t map_prefix(const std::string_view pallet, const std::string_view map) {
  auto b = builder{};
  b.hash128(pallet).hash128(map);
  return b.data;
}

bytes_t storage_map_final_key(const std::string_view pallet,
                              const std::string_view map,
                              const bytes_view_t& map_key) {
  auto b = builder{};
  b.hash128(pallet).hash128(map).hash128_concat(map_key);
  return b.data;
}

bytes_t outbound_message_key(const std::string_view pallet,
                             const lane_id_t& lane,
                             const message_nonce_t nonce) {
  auto map_key = builder{};
  map_key.write(lane).write(nonce);
  return storage_map_final_key(pallet, kOutboundMessagesMap, map_key.data);
}

bytes_t outbound_lane_data_key(const std::string_view pallet,
                               const lane_id_t& lane) {
  return storage_map_final_key(pallet, kOutboundLanesMap,
                               std::span(lane.data(), lane.size()));
}

bytes_t inbound_lane_data_key(const std::string_view pallet,
                              const lane_id_t& lane) {
  return storage_map_final_key(pallet, kInboundLanesMap,
                               std::span(lane.data(), lane.size()));
}

bytes_t parachain_head_key(const uint32_t para_id) {
  auto map_key = builder{};
  map_key.write(para_id);
  return storage_map_final_key(kParasPallet, kParaHeadsMap, map_key.data);
}

}  // namespace lanebridge::schema::key
