#pragma once

#include <lanebridge/schema/primitives.hpp>

#include <string_view>

// Schema key type: fee market records.
// Local bookkeeping that is never proved to the bridged chain.
namespace lanebridge::schema::key {

inline constexpr std::string_view kFeeMarketPrefix{"SYS|FEE|"};
inline constexpr std::string_view kOrderKeyPrefix{"SYS|FEE|ORDER|"};
inline constexpr std::string_view kRelayerKeyPrefix{"SYS|FEE|RELAYER|"};
inline constexpr std::string_view kRelayerSequenceKey{"SYS|FEE|RELAYER_SEQ"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|FEE|BALANCE|"};

bytes_t make_order_key(const lane_id_t& lane, message_nonce_t nonce);
bytes_t make_relayer_key(const account_id_t& relayer);
bytes_t make_relayer_sequence_key();
bytes_t make_balance_key(const account_id_t& account);

}  // namespace lanebridge::schema::key
