#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <segurolluvia/common/critical.hpp>
#include <segurolluvia/config/processor_config.hpp>
#include <segurolluvia/execution/engine.hpp>
#include <segurolluvia/schema/key/address.hpp>
#include <segurolluvia/storage/rocksdb/storage.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace po = boost::program_options;
using encoder_t = segurolluvia::schema::encoding::scale_encoder_t;

void configure_logging(const std::string& log_file, const bool verbose) {
  spdlog::init_thread_pool(8192, 1);
  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }
  auto logger = std::make_shared<spdlog::async_logger>(
      "segurolluvia", std::begin(sinks), std::end(sinks),
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

/// Raw SCALE bytes, or hex text as printed by payload_builder.
std::optional<segurolluvia::schema::bytes_t> read_file(const std::string& path,
                                                       const bool hex) {
  auto input = std::ifstream{path, std::ios::binary};
  if (!input.good()) {
    spdlog::error("Failed opening payload file '{}'", path);
    return std::nullopt;
  }
  auto content = std::string{std::istreambuf_iterator<char>{input},
                             std::istreambuf_iterator<char>{}};
  if (!hex) {
    return segurolluvia::schema::make_bytes(std::string_view{content});
  }
  auto decoded = segurolluvia::schema::try_from_hex(content);
  if (!decoded) {
    spdlog::error("Payload file '{}' is not valid hex", path);
  }
  return decoded;
}

void print_result(const std::string& path,
                  const segurolluvia::schema::transaction_result_t& result) {
  std::cout << path << ": code=" << result.code;
  if (!result.codespace.empty()) {
    std::cout << " codespace=" << result.codespace;
  }
  std::cout << " info=\"" << result.info << "\"" << std::endl;
}

int run_transactions(segurolluvia::execution::engine& engine,
                     const std::vector<std::string>& files,
                     const bool hex,
                     const bool check_only) {
  auto internal_errors = 0;
  auto rejected = 0;
  for (const auto& path : files) {
    auto payload = read_file(path, hex);
    if (!payload) {
      ++internal_errors;
      continue;
    }
    auto view =
        segurolluvia::schema::bytes_view_t{payload->data(), payload->size()};
    auto result =
        check_only ? engine.check_transaction(view) : engine.apply(view);
    print_result(path, result);
    if (result.internal_error()) {
      ++internal_errors;
    } else if (!result.ok()) {
      ++rejected;
    }
  }
  spdlog::info("Processed {} payload(s): {} rejected, {} internal error(s)",
               files.size(), rejected, internal_errors);
  if (internal_errors > 0) {
    return 2;
  }
  return rejected > 0 ? 1 : 0;
}

int run_query(segurolluvia::execution::engine& engine,
              const encoder_t& encoder,
              const std::string& purchase) {
  auto result = engine.query(purchase);
  std::cout << "address: " << segurolluvia::schema::to_hex(result.key)
            << std::endl;
  if (result.code != 0) {
    std::cout << result.log << std::endl;
    return 1;
  }
  auto entry = encoder.decode<segurolluvia::schema::purchase_entry_t>(
      segurolluvia::schema::bytes_view_t{result.value.data(),
                                         result.value.size()});
  std::cout << "name: " << entry.name << '\n'
            << "mail: " << entry.mail << '\n'
            << "bankAccount: " << entry.bank_account << '\n'
            << "placeAddress: " << entry.place_address << '\n'
            << "town: " << entry.town << '\n'
            << "province: " << entry.province << '\n'
            << "checkinDate: " << entry.checkin_date << '\n'
            << "checkoutDate: " << entry.checkout_date << '\n'
            << "days: " << entry.days << '\n'
            << "rainAmount: " << entry.rain_amount << '\n'
            << "startHour: " << entry.start_hour << '\n'
            << "endHour: " << entry.end_hour << '\n'
            << "refund: " << entry.refund << '\n'
            << "total: " << entry.total << std::endl;
  return 0;
}

int run_list(segurolluvia::storage::storage<
                 segurolluvia::storage::rocksdb_storage_tag>& storage,
             const encoder_t& encoder,
             const segurolluvia::config::processor_config& config) {
  auto prefix = config.namespace_prefix;
  auto entries = storage.list_by_prefix(
      segurolluvia::schema::bytes_view_t{prefix.data(), prefix.size()});
  for (const auto& [address, value] : entries) {
    auto record = encoder.try_decode<segurolluvia::schema::policy_record_t>(
        segurolluvia::schema::bytes_view_t{value.data(), value.size()});
    if (!record) {
      spdlog::warn("Record at {} does not decode",
                   segurolluvia::schema::to_hex(address));
      continue;
    }
    for (const auto& [purchase, entry] : *record) {
      std::cout << segurolluvia::schema::to_hex(address) << ' ' << purchase
                << " refund=" << entry.refund << std::endl;
    }
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto command = std::string{};
  auto files = std::vector<std::string>{};
  auto db_path = std::string{};
  auto config_path = std::string{};
  auto log_file = std::string{};
  auto purchase = std::string{};

  auto description =
      po::options_description{"segurolluvia transaction processor"};
  description.add_options()("help,h", "Show the help message")(
      "db-path,d",
      po::value<std::string>(&db_path)->default_value("segurolluvia-state"),
      "RocksDB state directory")(
      "config,c", po::value<std::string>(&config_path),
      "INI file with option defaults")("read-only",
                                        "Open the state store read-only")(
      "log-file", po::value<std::string>(&log_file),
      "Also write logs to this file")(
      "hex", "Payload files hold hex text instead of raw bytes")("purchase,p",
                                      po::value<std::string>(&purchase),
                                      "Purchase id for the query command")(
      "verbose,v", "Enable debug logging");

  auto hidden = po::options_description{};
  hidden.add_options()("command", po::value<std::string>(&command))(
      "files", po::value<std::vector<std::string>>(&files));
  auto positional = po::positional_options_description{};
  positional.add("command", 1).add("files", -1);

  auto all = po::options_description{};
  all.add(description).add(hidden);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      po::store(po::parse_config_file<char>(
                    vm["config"].as<std::string>().c_str(), description),
                vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n' << description << std::endl;
    return 64;
  }

  if (vm.contains("help") || command.empty()) {
    std::cout << "Usage: segurolluvia <apply|check|query|info|list> "
                 "[payload files...]\n"
              << description << std::endl;
    return command.empty() && !vm.contains("help") ? 64 : 0;
  }

  configure_logging(log_file, vm.contains("verbose"));

  auto config = segurolluvia::config::make_processor_config();
  auto config_error = std::string{};
  if (!segurolluvia::config::validate_config(config, config_error)) {
    segurolluvia::common::critical("Invalid processor configuration",
                                   config_error);
  }

  auto encoder = encoder_t{};
  auto storage = segurolluvia::storage::make_storage<
      segurolluvia::storage::rocksdb_storage_tag>(db_path,
                                                  vm.contains("read-only"));
  auto engine = segurolluvia::execution::engine{
      encoder, segurolluvia::execution::make_state_gateway(storage), config};

  auto exit_code = 0;
  if (command == "apply" || command == "check") {
    exit_code = run_transactions(engine, files, vm.contains("hex"),
                                 command == "check");
  } else if (command == "query") {
    if (purchase.empty()) {
      std::cerr << "query requires --purchase" << std::endl;
      exit_code = 64;
    } else {
      exit_code = run_query(engine, encoder, purchase);
    }
  } else if (command == "info") {
    auto info = engine.info();
    std::cout << "family: " << info.family_name << '\n'
              << "versions: " << info.family_versions.front() << '\n'
              << "namespace: " << info.namespaces.front() << std::endl;
  } else if (command == "list") {
    exit_code = run_list(storage, encoder, config);
  } else {
    std::cerr << "unknown command '" << command << "'" << std::endl;
    exit_code = 64;
  }

  spdlog::shutdown();
  return exit_code;
}
