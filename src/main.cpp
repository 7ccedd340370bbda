#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <trackchain/blake3/hash.hpp>
#include <trackchain/common/critical.hpp>
#include <trackchain/execution/engine.hpp>
#include <trackchain/schema/genesis_state.hpp>
#include <trackchain/schema/transaction_error_code.hpp>
#include <trackchain/storage/rocksdb/storage.hpp>

#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

using encoder_t = trackchain::execution::encoder_t;

struct runner_options final {
  std::string command;
  std::string config_path;
  std::string db_path;
  std::string chain_name;
  std::vector<std::string> admins;
  bool strict_crypto{true};
  std::string log_level;
  std::string log_file;
  std::string tx_file;
  uint64_t block_time{};
  std::string path;
  std::string key;
};

void init_logging(const runner_options& options) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
  if (!options.log_file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        options.log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "trackchain", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(options.log_level));
}

uint64_t now_ms() {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

std::vector<trackchain::schema::bytes_t> read_transactions(
    const std::string& path) {
  auto input = std::ifstream{path};
  if (!input) {
    trackchain::common::critical("cannot open transaction file '{}'", path);
  }
  auto txs = std::vector<trackchain::schema::bytes_t>{};
  auto line = std::string{};
  while (std::getline(input, line)) {
    if (line.empty() || line.starts_with('#')) {
      continue;
    }
    auto decoded = trackchain::schema::try_from_base64(line);
    if (!decoded) {
      spdlog::warn("Skipping line that is not base64: {}", line);
      continue;
    }
    txs.push_back(std::move(decoded.value()));
  }
  return txs;
}

int run_init(trackchain::execution::engine& engine,
             const runner_options& options) {
  auto genesis = trackchain::schema::genesis_state_t{
      .chain_id = trackchain::blake3::hash(std::string_view{options.chain_name}),
      .genesis_time = now_ms()};
  for (const auto& admin : options.admins) {
    auto identity = trackchain::schema::try_parse_identity(admin);
    if (!identity) {
      spdlog::error("Invalid administrator identity '{}'", admin);
      return 1;
    }
    genesis.admins.push_back(identity.value());
  }
  if (!engine.init_chain(genesis)) {
    return 1;
  }
  std::cout << trackchain::schema::to_hex(genesis.chain_id) << '\n';
  return 0;
}

int run_apply(trackchain::execution::engine& engine,
              const runner_options& options) {
  auto txs = read_transactions(options.tx_file);
  auto height =
      static_cast<uint64_t>(engine.info().last_block_height) + 1;
  auto block_time = options.block_time == 0 ? now_ms() : options.block_time;
  auto block = engine.finalize_block(height, block_time, txs);
  auto committed = engine.commit();

  for (size_t i = 0; i < block.tx_results.size(); ++i) {
    const auto& result = block.tx_results[i];
    std::cout << i << ' ' << result.code << ' '
              << trackchain::schema::to_string(
                     trackchain::schema::classify(result.code))
              << ' ' << (result.code == 0 ? result.info : result.log) << '\n';
  }
  std::cout << "height " << committed.committed_height << " root "
            << trackchain::schema::to_hex(committed.state_root) << '\n';
  return 0;
}

int run_query(trackchain::execution::engine& engine,
              const runner_options& options) {
  auto key = trackchain::schema::try_from_base64(options.key);
  if (!key) {
    spdlog::error("--key must be base64");
    return 1;
  }
  auto result = engine.query(options.path, *key);
  std::cout << result.code << ' ' << trackchain::schema::to_base64(result.value)
            << '\n';
  if (result.code != 0) {
    spdlog::warn("Query {} failed: {}", options.path, result.log);
  }
  return result.code == 0 ? 0 : 1;
}

int run_info(trackchain::execution::engine& engine) {
  auto info = engine.info();
  std::cout << info.data << ' ' << info.version << " height "
            << info.last_block_height << " root "
            << trackchain::schema::to_hex(info.last_block_state_root)
            << " time " << info.last_block_time << '\n';
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto options = runner_options{};

  auto generic = po::options_description{"Generic"};
  generic.add_options()("help,h", "Show the help message")(
      "command", po::value<std::string>(&options.command),
      "init|apply|query|info")(
      "config,c", po::value<std::string>(&options.config_path),
      "INI style configuration file");

  auto config = po::options_description{"Configuration"};
  config.add_options()(
      "db-path", po::value<std::string>(&options.db_path)
                     ->default_value("trackchain-db"),
      "RocksDB directory")(
      "chain-name",
      po::value<std::string>(&options.chain_name)
          ->default_value("trackchain-local"),
      "Chain name hashed into the chain id")(
      "admin", po::value<std::vector<std::string>>(&options.admins)->composing(),
      "Genesis administrator identity (repeatable)")(
      "strict-crypto",
      po::value<bool>(&options.strict_crypto)->default_value(true),
      "Verify transaction signatures")(
      "log-level",
      po::value<std::string>(&options.log_level)->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>(&options.log_file),
      "Also log to this file");

  auto commands = po::options_description{"Command"};
  commands.add_options()(
      "tx-file", po::value<std::string>(&options.tx_file),
      "apply: file with one base64 transaction per line")(
      "block-time", po::value<uint64_t>(&options.block_time)->default_value(0),
      "apply: block time in ms, 0 for now")(
      "path", po::value<std::string>(&options.path), "query: route")(
      "key", po::value<std::string>(&options.key)->default_value(""),
      "query: base64 key");

  auto command_line = po::options_description{"trackchain"};
  command_line.add(generic).add(config).add(commands);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(command_line)
                .positional(positional)
                .run(),
            vm);
  if (vm.contains("config")) {
    auto path = vm["config"].as<std::string>();
    auto file = std::ifstream{path};
    if (!file) {
      std::cerr << "cannot open config file " << path << '\n';
      return 1;
    }
    po::store(po::parse_config_file(file, config), vm);
  }
  po::notify(vm);

  if (vm.contains("help") || options.command.empty()) {
    std::cout << command_line << std::endl;
    return 0;
  }

  init_logging(options);

  auto encoder = encoder_t{};
  auto storage =
      trackchain::storage::make_storage<trackchain::storage::rocksdb_storage_tag>(
          options.db_path);
  auto engine = trackchain::execution::engine{encoder, storage,
                                              options.strict_crypto};

  auto status = 1;
  if (options.command == "init") {
    status = run_init(engine, options);
  } else if (options.command == "apply") {
    if (options.tx_file.empty()) {
      spdlog::error("apply requires --tx-file");
    } else {
      status = run_apply(engine, options);
    }
  } else if (options.command == "query") {
    if (options.path.empty()) {
      spdlog::error("query requires --path");
    } else {
      status = run_query(engine, options);
    }
  } else if (options.command == "info") {
    status = run_info(engine);
  } else {
    spdlog::error("Unknown command '{}'", options.command);
  }

  spdlog::shutdown();
  return status;
}
