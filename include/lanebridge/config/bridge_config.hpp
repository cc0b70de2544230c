#pragma once

#include <lanebridge/schema/permill.hpp>
#include <lanebridge/schema/primitives.hpp>
#include <lanebridge/schema/weight.hpp>

#include <boost/program_options.hpp>
#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace lanebridge::config {

inline constexpr std::string_view kDefaultPallet{"BridgeMessages"};

/// Everything a bridge instance is parameterized with.
struct bridge_config final {
  lanebridge::schema::chain_id_t this_chain{};
  lanebridge::schema::chain_id_t bridged_chain{};
  uint32_t spec_version{1};
  /// Namespace of our lane records.
  std::string pallet{kDefaultPallet};
  /// Namespace of the lane records at the bridged chain.
  std::string bridged_pallet{kDefaultPallet};
  /// Lanes open for outbound messages; empty means all.
  std::set<lanebridge::schema::lane_id_t> lanes;

  uint64_t max_pending_messages{128};
  uint32_t max_extrinsic_size{5 * 1024 * 1024};
  lanebridge::schema::weight_t max_extrinsic_weight{2'000'000'000'000};
  uint64_t max_unrewarded_relayers{16};
  uint64_t max_messages_in_confirmation{128};
  uint64_t max_messages_to_prune{8};

  lanebridge::schema::account_id_t fund_account{};
  lanebridge::schema::account_id_t treasury_account{};
  lanebridge::schema::permill_t relayer_fee_ratio{
      lanebridge::schema::permill_t::from_percent(40)};
  lanebridge::schema::permill_t assigned_relayers_reward_ratio{
      lanebridge::schema::permill_t::from_percent(60)};
  lanebridge::schema::permill_t message_relayers_reward_ratio{
      lanebridge::schema::permill_t::from_percent(80)};
  lanebridge::schema::permill_t confirm_relayers_reward_ratio{
      lanebridge::schema::permill_t::from_percent(20)};
  lanebridge::schema::permill_t assigned_relayer_slash_ratio{
      lanebridge::schema::permill_t::from_percent(20)};
  std::optional<lanebridge::schema::amount_t> collateral_slash_protect;
  lanebridge::schema::block_number_t slot_length{300};
  uint32_t assigned_relayers_number{3};
  lanebridge::schema::amount_t collateral_per_order{100};
  lanebridge::schema::amount_t slash_per_block{2};

  uint64_t max_future_number_difference{10};
};

using bridge_config_t = bridge_config;

/// Defaults, with the fund and treasury accounts derived from fixed names.
bridge_config_t default_config();

/// First inconsistency found, if any.
std::optional<std::string> validate(const bridge_config_t& config);

/// Register every option with its default.
void add_options(boost::program_options::options_description& description);

/// Fill `config` from parsed options. On failure `error` says which option
/// is malformed.
bool load(const boost::program_options::variables_map& vm,
          bridge_config_t& config,
          std::string& error);

/// Merge an INI style file into `vm`.
bool parse_config_file(const std::string& path,
                       const boost::program_options::options_description& description,
                       boost::program_options::variables_map& vm,
                       std::string& error);

}  // namespace lanebridge::config
