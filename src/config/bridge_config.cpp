#include <lanebridge/blake3/hash.hpp>
#include <lanebridge/config/bridge_config.hpp>

#include <fstream>
#include <vector>

namespace po = boost::program_options;

namespace lanebridge::config {

namespace {

bool load_percent(const po::variables_map& vm,
                  const char* name,
                  lanebridge::schema::permill_t& out,
                  std::string& error) {
  const auto percent = vm[name].as<uint32_t>();
  if (percent > 100) {
    error = std::string{name} + " must be at most 100";
    return false;
  }
  out = lanebridge::schema::permill_t::from_percent(percent);
  return true;
}

bool load_amount(const po::variables_map& vm,
                 const char* name,
                 lanebridge::schema::amount_t& out,
                 std::string& error) {
  auto value = lanebridge::schema::try_make_amount(vm[name].as<std::string>());
  if (!value) {
    error = std::string{name} + " is not a decimal amount";
    return false;
  }
  out = *value;
  return true;
}

bool load_account(const po::variables_map& vm,
                  const char* name,
                  lanebridge::schema::account_id_t& out,
                  std::string& error) {
  if (!vm.contains(name)) {
    return true;
  }
  auto value = lanebridge::schema::try_make_hash32(vm[name].as<std::string>());
  if (!value) {
    error = std::string{name} + " must be 32 hex encoded bytes";
    return false;
  }
  out = *value;
  return true;
}

bool load_chain(const po::variables_map& vm,
                const char* name,
                lanebridge::schema::chain_id_t& out,
                std::string& error) {
  auto value =
      lanebridge::schema::try_make_chain_id(vm[name].as<std::string>());
  if (!value) {
    error = std::string{name} + " must be 4 hex encoded bytes";
    return false;
  }
  out = *value;
  return true;
}

}  // namespace

bridge_config_t default_config() {
  auto config = bridge_config_t{};
  config.this_chain = lanebridge::schema::chain_id_t{0x00, 0x00, 0x00, 0x01};
  config.bridged_chain = lanebridge::schema::chain_id_t{0x00, 0x00, 0x00, 0x02};
  config.fund_account = lanebridge::blake3::hash("lanebridge/relayer-fund");
  config.treasury_account = lanebridge::blake3::hash("lanebridge/treasury");
  return config;
}

std::optional<std::string> validate(const bridge_config_t& config) {
  if (config.this_chain == config.bridged_chain) {
    return "this chain and bridged chain must differ";
  }
  if (config.pallet.empty() || config.bridged_pallet.empty()) {
    return "pallet names must not be empty";
  }
  if (config.max_pending_messages == 0) {
    return "max pending messages must be positive";
  }
  if (config.max_extrinsic_size == 0) {
    return "max extrinsic size must be positive";
  }
  if (config.max_unrewarded_relayers == 0) {
    return "max unrewarded relayers must be positive";
  }
  if (config.max_messages_in_confirmation == 0) {
    return "max messages in confirmation must be positive";
  }
  if (config.max_messages_to_prune == 0) {
    return "max messages to prune must be positive";
  }
  for (const auto& ratio :
       {config.relayer_fee_ratio, config.assigned_relayers_reward_ratio,
        config.message_relayers_reward_ratio,
        config.confirm_relayers_reward_ratio,
        config.assigned_relayer_slash_ratio}) {
    if (ratio.parts > lanebridge::schema::permill_t::kOne) {
      return "ratios must not exceed 100%";
    }
  }
  if (config.message_relayers_reward_ratio.parts +
          config.confirm_relayers_reward_ratio.parts !=
      lanebridge::schema::permill_t::kOne) {
    return "message and confirm relayer ratios must add up to 100%";
  }
  if (config.slot_length == 0) {
    return "slot length must be positive";
  }
  if (config.assigned_relayers_number == 0) {
    return "at least one assigned relayer is required";
  }
  if (config.fund_account == config.treasury_account) {
    return "fund and treasury accounts must differ";
  }
  return std::nullopt;
}

void add_options(po::options_description& description) {
  const auto defaults = default_config();
  description.add_options()
      ("this-chain", po::value<std::string>()->default_value("00000001"),
       "Chain id of this chain (4 hex bytes)")
      ("bridged-chain", po::value<std::string>()->default_value("00000002"),
       "Chain id of the bridged chain (4 hex bytes)")
      ("spec-version", po::value<uint32_t>()->default_value(defaults.spec_version),
       "Runtime spec version messages must target")
      ("pallet", po::value<std::string>()->default_value(defaults.pallet),
       "Storage namespace of local lane records")
      ("bridged-pallet",
       po::value<std::string>()->default_value(defaults.bridged_pallet),
       "Storage namespace of lane records at the bridged chain")
      ("lane", po::value<std::vector<std::string>>()->composing(),
       "Lane open for outbound messages (repeatable, 4 hex bytes)")
      ("max-pending-messages",
       po::value<uint64_t>()->default_value(defaults.max_pending_messages),
       "Maximum undelivered messages per outbound lane")
      ("max-extrinsic-size",
       po::value<uint32_t>()->default_value(defaults.max_extrinsic_size),
       "Maximum extrinsic size at the bridged chain")
      ("max-extrinsic-weight",
       po::value<uint64_t>()->default_value(
           defaults.max_extrinsic_weight.ref_time()),
       "Maximum extrinsic weight at the bridged chain")
      ("max-unrewarded-relayers",
       po::value<uint64_t>()->default_value(defaults.max_unrewarded_relayers),
       "Maximum relayer entries kept at an inbound lane")
      ("max-messages-in-confirmation",
       po::value<uint64_t>()->default_value(
           defaults.max_messages_in_confirmation),
       "Maximum messages confirmed by one delivery proof")
      ("max-messages-to-prune",
       po::value<uint64_t>()->default_value(defaults.max_messages_to_prune),
       "Maximum messages pruned per confirmation")
      ("fund-account", po::value<std::string>(),
       "Relayer fund account (32 hex bytes)")
      ("treasury-account", po::value<std::string>(),
       "Treasury account (32 hex bytes)")
      ("relayer-fee-percent", po::value<uint32_t>()->default_value(40),
       "Share of the message fee paid to relayers")
      ("assigned-relayers-reward-percent",
       po::value<uint32_t>()->default_value(60),
       "Share of the relayer fee paid to the slot relayer")
      ("message-relayers-reward-percent",
       po::value<uint32_t>()->default_value(80),
       "Share of the remaining fee paid to the message relayer")
      ("confirm-relayers-reward-percent",
       po::value<uint32_t>()->default_value(20),
       "Share of the remaining fee paid to the confirm relayer")
      ("assigned-relayer-slash-percent",
       po::value<uint32_t>()->default_value(20),
       "Share of locked collateral slashed per missed slot")
      ("collateral-slash-protect", po::value<std::string>(),
       "Ceiling of one relayer's slash after all deadlines")
      ("slot-length",
       po::value<uint64_t>()->default_value(defaults.slot_length),
       "Blocks per assigned relayer slot")
      ("assigned-relayers-number",
       po::value<uint32_t>()->default_value(defaults.assigned_relayers_number),
       "Relayers assigned to each order")
      ("collateral-per-order", po::value<std::string>()->default_value("100"),
       "Collateral an assigned relayer locks per order")
      ("slash-per-block", po::value<std::string>()->default_value("2"),
       "Delay penalty per block after the last deadline")
      ("max-future-number-difference",
       po::value<uint64_t>()->default_value(
           defaults.max_future_number_difference),
       "Blocks ahead of best accepted into the header pool");
}

bool load(const po::variables_map& vm,
          bridge_config_t& config,
          std::string& error) {
  config = default_config();
  if (!load_chain(vm, "this-chain", config.this_chain, error) ||
      !load_chain(vm, "bridged-chain", config.bridged_chain, error)) {
    return false;
  }
  config.spec_version = vm["spec-version"].as<uint32_t>();
  config.pallet = vm["pallet"].as<std::string>();
  config.bridged_pallet = vm["bridged-pallet"].as<std::string>();
  if (vm.contains("lane")) {
    for (const auto& lane : vm["lane"].as<std::vector<std::string>>()) {
      auto id = lanebridge::schema::try_make_lane_id(lane);
      if (!id) {
        error = "lane " + lane + " must be 4 hex encoded bytes";
        return false;
      }
      config.lanes.insert(*id);
    }
  }
  config.max_pending_messages = vm["max-pending-messages"].as<uint64_t>();
  config.max_extrinsic_size = vm["max-extrinsic-size"].as<uint32_t>();
  config.max_extrinsic_weight =
      lanebridge::schema::weight_t{vm["max-extrinsic-weight"].as<uint64_t>()};
  config.max_unrewarded_relayers = vm["max-unrewarded-relayers"].as<uint64_t>();
  config.max_messages_in_confirmation =
      vm["max-messages-in-confirmation"].as<uint64_t>();
  config.max_messages_to_prune = vm["max-messages-to-prune"].as<uint64_t>();

  if (!load_account(vm, "fund-account", config.fund_account, error) ||
      !load_account(vm, "treasury-account", config.treasury_account, error)) {
    return false;
  }
  if (!load_percent(vm, "relayer-fee-percent", config.relayer_fee_ratio,
                    error) ||
      !load_percent(vm, "assigned-relayers-reward-percent",
                    config.assigned_relayers_reward_ratio, error) ||
      !load_percent(vm, "message-relayers-reward-percent",
                    config.message_relayers_reward_ratio, error) ||
      !load_percent(vm, "confirm-relayers-reward-percent",
                    config.confirm_relayers_reward_ratio, error) ||
      !load_percent(vm, "assigned-relayer-slash-percent",
                    config.assigned_relayer_slash_ratio, error)) {
    return false;
  }
  if (vm.contains("collateral-slash-protect")) {
    auto protect = lanebridge::schema::amount_t{};
    if (!load_amount(vm, "collateral-slash-protect", protect, error)) {
      return false;
    }
    config.collateral_slash_protect = protect;
  }
  config.slot_length = vm["slot-length"].as<uint64_t>();
  config.assigned_relayers_number =
      vm["assigned-relayers-number"].as<uint32_t>();
  if (!load_amount(vm, "collateral-per-order", config.collateral_per_order,
                   error) ||
      !load_amount(vm, "slash-per-block", config.slash_per_block, error)) {
    return false;
  }
  config.max_future_number_difference =
      vm["max-future-number-difference"].as<uint64_t>();

  if (auto invalid = validate(config)) {
    error = *invalid;
    return false;
  }
  return true;
}

bool parse_config_file(const std::string& path,
                       const po::options_description& description,
                       po::variables_map& vm,
                       std::string& error) {
  auto file = std::ifstream{path};
  if (!file) {
    error = "cannot open config file " + path;
    return false;
  }
  try {
    po::store(po::parse_config_file(file, description), vm);
  } catch (const po::error& e) {
    error = e.what();
    return false;
  }
  return true;
}

}  // namespace lanebridge::config
