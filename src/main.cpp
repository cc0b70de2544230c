#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <lanebridge/config/bridge_config.hpp>
#include <lanebridge/lane/inbound_lane.hpp>
#include <lanebridge/lane/outbound_lane.hpp>
#include <lanebridge/proof/proof_builder.hpp>
#include <lanebridge/reward/currency.hpp>
#include <lanebridge/reward/order_book.hpp>
#include <lanebridge/reward/relayer_registry.hpp>
#include <lanebridge/schema/encoding/scale/encoder.hpp>
#include <lanebridge/storage/rocksdb/storage.hpp>
#include <iostream>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace {

void print_lane(lanebridge::schema::encoding::scale_encoder_t& encoder,
                lanebridge::storage::rocksdb_storage_t& storage,
                const lanebridge::config::bridge_config_t& config,
                const lanebridge::schema::lane_id_t& lane,
                const bool show_proof) {
  const auto outbound =
      lanebridge::lane::outbound_lane{encoder, storage, config.pallet, lane}
          .data();
  const auto inbound =
      lanebridge::lane::inbound_lane{encoder, storage, config.pallet, lane,
                                     config.max_unrewarded_relayers}
          .data();

  std::cout << "lane " << lanebridge::schema::to_hex(lane) << "\n"
            << "  outbound oldest_unpruned=" << outbound.oldest_unpruned_nonce
            << " latest_received=" << outbound.latest_received_nonce
            << " latest_generated=" << outbound.latest_generated_nonce
            << " pending=" << outbound.pending_messages() << "\n"
            << "  inbound last_confirmed=" << inbound.last_confirmed_nonce
            << " unrewarded_relayers=" << inbound.relayers.size() << "\n";
  for (const auto& entry : inbound.relayers) {
    std::cout << "    " << lanebridge::schema::to_hex(entry.relayer) << " ["
              << entry.messages.begin << ", " << entry.messages.end << "]\n";
  }

  if (!show_proof) {
    return;
  }
  auto builder = lanebridge::proof::proof_builder{storage, config.pallet};
  const auto root = builder.state_root();
  std::cout << "  state_root " << lanebridge::schema::to_hex(root) << "\n";
  if (outbound.pending_messages() > 0) {
    const auto proof = builder.messages_proof(
        root, lane, outbound.latest_received_nonce + 1,
        outbound.latest_generated_nonce, true);
    std::cout << "  messages_proof "
              << lanebridge::schema::to_hex(encoder.encode(proof)) << "\n";
  }
  const auto delivery = builder.delivery_proof(root, lane);
  std::cout << "  delivery_proof "
            << lanebridge::schema::to_hex(encoder.encode(delivery)) << "\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::info);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      "lanebridge.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "lanebridge", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);

  auto db_path = std::string{};
  auto config_path = std::string{};

  auto generic = po::options_description{"Lanebridge"};
  generic.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "INI file with bridge options")(
      "db-path,d",
      po::value<std::string>(&db_path)->default_value("lanebridge.db"),
      "RocksDB directory holding the lane records")(
      "inspect-lane,l", po::value<std::vector<std::string>>()->composing(),
      "Lane to print (repeatable, 4 hex bytes)")(
      "show-proof,p", "Print state root and hex encoded proofs")(
      "verbose,v", "Enable verbose output");

  auto bridge = po::options_description{"Bridge"};
  lanebridge::config::add_options(bridge);

  auto description = po::options_description{};
  description.add(generic).add(bridge);

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    spdlog::error("{}", e.what());
    spdlog::shutdown();
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    spdlog::shutdown();
    return 0;
  }

  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  auto error = std::string{};
  if (!config_path.empty()) {
    if (!lanebridge::config::parse_config_file(config_path, bridge, vm,
                                               error)) {
      spdlog::error("{}", error);
      spdlog::shutdown();
      return 1;
    }
    po::notify(vm);
  }

  auto config = lanebridge::config::bridge_config_t{};
  if (!lanebridge::config::load(vm, config, error)) {
    spdlog::error("Invalid configuration: {}", error);
    spdlog::shutdown();
    return 1;
  }

  auto lanes = std::vector<lanebridge::schema::lane_id_t>{};
  if (vm.contains("inspect-lane")) {
    for (const auto& hex : vm["inspect-lane"].as<std::vector<std::string>>()) {
      auto lane = lanebridge::schema::try_make_lane_id(hex);
      if (!lane) {
        spdlog::error("Lane {} must be 4 hex encoded bytes", hex);
        spdlog::shutdown();
        return 1;
      }
      lanes.push_back(*lane);
    }
  } else {
    lanes.assign(std::begin(config.lanes), std::end(config.lanes));
  }

  spdlog::info("Opening lane records at {}", db_path);
  auto encoder = lanebridge::schema::encoding::scale_encoder_t{};
  auto storage =
      lanebridge::storage::make_storage<lanebridge::storage::rocksdb_storage_tag>(
          db_path);

  for (const auto& lane : lanes) {
    print_lane(encoder, storage, config, lane, vm.contains("show-proof"));
  }

  auto currency = lanebridge::reward::storage_currency{encoder, storage};
  const auto orders = lanebridge::reward::order_book{encoder, storage};
  auto registry =
      lanebridge::reward::relayer_registry{encoder, storage, currency, orders};
  const auto relayers = registry.relayers();
  std::cout << "relayers " << relayers.size() << "\n";
  for (const auto& relayer : relayers) {
    std::cout << "  " << lanebridge::schema::to_hex(relayer.id)
              << " fee=" << relayer.fee.str()
              << " collateral=" << relayer.collateral.str() << "\n";
  }
  if (auto fee = registry.market_fee(config.assigned_relayers_number,
                                     config.collateral_per_order)) {
    std::cout << "market_fee " << fee->str() << "\n";
  } else {
    std::cout << "market_fee unavailable\n";
  }

  spdlog::shutdown();
  return 0;
}
