#include <boost/program_options.hpp>
#include <segurolluvia/config/processor_config.hpp>
#include <segurolluvia/schema/encoding/scale/encoder.hpp>
#include <segurolluvia/schema/key/address.hpp>
#include <segurolluvia/schema/payload.hpp>

#include <array>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

using encoder_t = segurolluvia::schema::encoding::scale_encoder_t;
namespace po = boost::program_options;
namespace field = segurolluvia::schema::field;

inline constexpr auto kStringFields = std::array{
    field::kVerb,         field::kName,        field::kMail,
    field::kPlaceAddress, field::kTown,        field::kProvince,
    field::kCheckinDate,  field::kCheckoutDate, field::kRainAmount,
    field::kStartHour,    field::kEndHour,     field::kPurchase,
    field::kTotal};

inline constexpr auto kIntegerFields =
    std::array{field::kBankAccount, field::kDays, field::kRefund};

segurolluvia::schema::payload_t build_payload(const po::variables_map& vm) {
  auto payload = segurolluvia::schema::payload_t{};
  for (const auto name : kStringFields) {
    auto key = std::string{name};
    if (vm.contains(key)) {
      payload.emplace(key, vm[key].as<std::string>());
    }
  }
  for (const auto name : kIntegerFields) {
    auto key = std::string{name};
    if (vm.contains(key)) {
      payload.emplace(key, vm[key].as<int64_t>());
    }
  }
  return payload;
}

int write_output(const segurolluvia::schema::bytes_t& bytes,
                 const po::variables_map& vm) {
  if (!vm.contains("output")) {
    std::cout << segurolluvia::schema::to_hex(
                     segurolluvia::schema::bytes_view_t{bytes.data(),
                                                        bytes.size()})
              << std::endl;
    return 0;
  }
  auto path = vm["output"].as<std::string>();
  auto output = std::ofstream{path, std::ios::binary | std::ios::trunc};
  output.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
  if (!output.good()) {
    std::cerr << "failed writing '" << path << "'" << std::endl;
    return 1;
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto description = po::options_description{"payload_builder"};
  description.add_options()("help,h", "Show the help message")(
      "output,o", po::value<std::string>(),
      "Write binary payload to file instead of printing hex");
  for (const auto name : kStringFields) {
    description.add_options()(std::string{name}.c_str(),
                              po::value<std::string>(), "string field");
  }
  for (const auto name : kIntegerFields) {
    description.add_options()(std::string{name}.c_str(), po::value<int64_t>(),
                              "integer field");
  }

  auto command = std::string{};
  auto hidden = po::options_description{};
  hidden.add_options()("command", po::value<std::string>(&command));
  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto all = po::options_description{};
  all.add(description).add(hidden);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << std::endl;
    return 64;
  }

  if (vm.contains("help") || command.empty()) {
    std::cout << "Usage: payload_builder <payload|address> [options]\n"
              << description << std::endl;
    return vm.contains("help") ? 0 : 64;
  }

  if (command == "payload") {
    auto encoder = encoder_t{};
    return write_output(encoder.encode(build_payload(vm)), vm);
  }
  if (command == "address") {
    auto key = std::string{field::kPurchase};
    if (!vm.contains(key)) {
      std::cerr << "address requires --purchase" << std::endl;
      return 64;
    }
    auto config = segurolluvia::config::make_processor_config();
    std::cout << segurolluvia::schema::to_hex(
                     segurolluvia::schema::key::make_address(
                         config.namespace_prefix, vm[key].as<std::string>()))
              << std::endl;
    return 0;
  }
  std::cerr << "unknown command '" << command << "'" << std::endl;
  return 64;
}
