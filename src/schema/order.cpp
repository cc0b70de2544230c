#include <lanebridge/schema/order.hpp>

namespace lanebridge::schema {

std::optional<std::size_t> delivery_slot(const order_t& value,
                                         const block_number_t at) {
  for (std::size_t index = 0; index < value.relayers.size(); ++index) {
    const auto& slot = value.relayers[index];
    if (at >= slot.valid_range_start && at < slot.valid_range_end) {
      return index;
    }
  }
  return std::nullopt;
}

block_number_t delivery_delay(const order_t& value, const block_number_t at) {
  if (value.relayers.empty()) {
    return 0;
  }
  const auto deadline = value.relayers.back().valid_range_end;
  return at >= deadline ? at - deadline : 0;
}

}  // namespace lanebridge::schema
