#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <bazaar/execution/engine.hpp>
#include <bazaar/schema/encoding/scale/encoder.hpp>
#include <bazaar/storage/rocksdb/storage.hpp>
#include <boost/program_options.hpp>
#include <cctype>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

std::optional<bazaar::schema::signer_id_t> parse_ed25519_signer(
    const std::string_view hex) {
  auto bytes = bazaar::schema::try_from_hex(hex);
  if (!bytes || bytes->size() != 32) {
    return std::nullopt;
  }
  auto signer = bazaar::schema::ed25519_signer_id{};
  std::ranges::copy(*bytes, std::begin(signer.public_key));
  return bazaar::schema::signer_id_t{signer};
}

std::optional<bazaar::schema::amount_t> parse_amount(
    const std::string_view text) {
  if (text.empty() || !std::ranges::all_of(text, [](const char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
      })) {
    return std::nullopt;
  }
  return bazaar::schema::amount_t{std::string{text}};
}

// `<hex ed25519 key>:<decimal amount>`
std::optional<std::pair<bazaar::schema::signer_id_t, bazaar::schema::amount_t>>
parse_allocation(const std::string_view value) {
  const auto separator = value.find(':');
  if (separator == std::string_view::npos) {
    return std::nullopt;
  }
  auto owner = parse_ed25519_signer(value.substr(0, separator));
  auto amount = parse_amount(value.substr(separator + 1));
  if (!owner || !amount) {
    return std::nullopt;
  }
  return std::pair{*owner, *amount};
}

}  // namespace

int main(int argc, char* argv[]) {
  auto db_path = std::string{};
  auto chain_name = std::string{};
  auto admin_hex = std::string{};
  auto allocations = std::vector<std::string>{};
  auto log_file = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Bazaar"};
  description.add_options()("help,h", "Show the help message")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "bazaar.db"),
      "RocksDB directory for marketplace state")(
      "chain-name,c",
      boost::program_options::value<std::string>(&chain_name)->default_value(
          "bazaar-local"),
      "Chain name hashed into the chain id on first start")(
      "admin,a", boost::program_options::value<std::string>(&admin_hex),
      "Hex Ed25519 public key receiving the arbitrator capability")(
      "allocation",
      boost::program_options::value<std::vector<std::string>>(&allocations)
          ->composing(),
      "Opening balance as <hex pubkey>:<amount>, repeatable")(
      "strict-crypto", boost::program_options::value<bool>()->default_value(true),
      "Verify Ed25519 transaction signatures")(
      "allow-any-quality", "Accept listings with quality above 100")(
      "log-file,l",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "bazaar.log"),
      "Log file path")("verbose,v", "Enable verbose output");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << '\n' << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "bazaar", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);

  auto genesis = bazaar::schema::genesis_t{};
  genesis.chain_name = chain_name;
  if (!admin_hex.empty()) {
    auto admin = parse_ed25519_signer(admin_hex);
    if (!admin) {
      spdlog::error("--admin must be a 32-byte hex Ed25519 public key");
      spdlog::shutdown();
      return 1;
    }
    genesis.admin = *admin;
  } else {
    spdlog::warn("No --admin given; arbitrator capability goes to the "
                 "zero key");
  }
  for (const auto& value : allocations) {
    auto allocation = parse_allocation(value);
    if (!allocation) {
      spdlog::error("Malformed --allocation '{}'", value);
      spdlog::shutdown();
      return 1;
    }
    genesis.allocations.push_back(std::move(*allocation));
  }

  auto encoder = bazaar::schema::encoding::encoder<
      bazaar::schema::encoding::scale_encoder_tag>{};
  auto storage =
      bazaar::storage::make_storage<bazaar::storage::rocksdb_storage_tag>(
          db_path);
  auto engine = bazaar::execution::engine{
      encoder, storage, genesis, vm["strict-crypto"].as<bool>(),
      !vm.contains("allow-any-quality")};

  const auto info = engine.info();
  const auto admin_cap = engine.admin_cap_id();
  spdlog::info("{} {} at height {}, chain {}, admin capability {}", info.data,
               info.version, info.last_block_height,
               bazaar::schema::to_hex(bazaar::schema::bytes_view_t{
                   info.chain_id.data(), info.chain_id.size()}),
               bazaar::schema::to_hex(bazaar::schema::bytes_view_t{
                   admin_cap.data(), admin_cap.size()}));

  spdlog::shutdown();
  return 0;
}
