#include <lanebridge/schema/key/builder.hpp>
#include <lanebridge/schema/key/fee_market_keys.hpp>

namespace lanebridge::schema::key {

bytes_t make_order_key(const lane_id_t& lane, const message_nonce_t nonce) {
  auto b = builder{};
  b.write(kOrderKeyPrefix).write(lane).write("|").write(nonce);
  return b.data;
}

bytes_t make_relayer_key(const account_id_t& relayer) {
  auto b = builder{};
  b.write(kRelayerKeyPrefix);
  b.write(relayer);
  return b.data;
}

bytes_t make_relayer_sequence_key() {
  auto b = builder{};
  b.write(kRelayerSequenceKey);
  return b.data;
}

bytes_t make_balance_key(const account_id_t& account) {
  auto b = builder{};
  b.write(kBalanceKeyPrefix);
  b.write(account);
  return b.data;
}

}  // namespace lanebridge::schema::key
