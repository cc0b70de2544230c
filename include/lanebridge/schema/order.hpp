#pragma once

#include <lanebridge/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <vector>

// Schema type: fee market order.
// Created when a message is accepted at the source chain and consumed once
// its delivery is confirmed.
namespace lanebridge::schema {

/// One assigned slot: the relayer expected to deliver inside
/// [valid_range_start, valid_range_end).
struct priority_relayer final {
  account_id_t id{};
  amount_t fee{};
  block_number_t valid_range_start{};
  block_number_t valid_range_end{};

  bool operator==(const priority_relayer&) const = default;
};

using priority_relayer_t = priority_relayer;

template <uint16_t Version>
struct order;

template <>
struct order<1> final {
  uint16_t version{1};
  lane_id_t lane{};
  message_nonce_t nonce{};
  amount_t fee{};
  block_number_t sent_time{};
  std::optional<block_number_t> confirm_time;
  /// Slot order; slot 0 has the earliest deadline.
  std::vector<priority_relayer_t> relayers;
  /// Collateral each assignee committed to this order.
  amount_t locked_collateral{};

  bool operator==(const order<1>&) const = default;
};

using order_t = order<1>;

/// Index of the slot whose window contains `at`, if any.
std::optional<std::size_t> delivery_slot(const order_t& value,
                                         block_number_t at);

/// Blocks between the last slot deadline and `at` (zero when on time).
block_number_t delivery_delay(const order_t& value, block_number_t at);

template <uint16_t Version>
struct relayer;

/// Registered relayer with its locked collateral and quoted fee.
template <>
struct relayer<1> final {
  uint16_t version{1};
  account_id_t id{};
  amount_t collateral{};
  amount_t fee{};
  /// Registration sequence, breaks ties between equal quotes.
  uint64_t enrolled_at{};

  bool operator==(const relayer<1>&) const = default;
};

using relayer_t = relayer<1>;

template <uint16_t Version>
struct account_balance;

/// Balance kept by the storage-backed currency. `locked` is the part held
/// as relayer collateral; it stays in the account but cannot be spent.
template <>
struct account_balance<1> final {
  uint16_t version{1};
  amount_t free{};
  amount_t locked{};

  bool operator==(const account_balance<1>&) const = default;
};

using account_balance_t = account_balance<1>;

}  // namespace lanebridge::schema
