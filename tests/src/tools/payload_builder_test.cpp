#include <gtest/gtest.h>
#include <segurolluvia/config/processor_config.hpp>
#include <segurolluvia/schema/encoding/scale/encoder.hpp>
#include <segurolluvia/schema/key/address.hpp>
#include <segurolluvia/schema/payload.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include <sys/wait.h>

#ifndef SEGUROLLUVIA_PAYLOAD_BUILDER_PATH
#define SEGUROLLUVIA_PAYLOAD_BUILDER_PATH ""
#endif

namespace {

using encoder_t = segurolluvia::schema::encoding::scale_encoder_t;

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim_ascii_whitespace(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), trim_ascii_whitespace(output)};
}

std::string builder_path() {
  return std::string{SEGUROLLUVIA_PAYLOAD_BUILDER_PATH};
}

}  // namespace

TEST(payload_builder, payload_command_encodes_typed_fields) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "payload_builder binary not available: " << builder;
  }

  auto [exit_code, output] = run_capture(
      shell_quote(builder) +
      " payload --verb buy --name Ana --mail a@x.com "
      "--bankAccount 1234567890123456 --days 7 --refund 100 --purchase P-1");
  ASSERT_EQ(exit_code, 0) << output;

  auto bytes = segurolluvia::schema::try_from_hex(output);
  ASSERT_TRUE(bytes.has_value()) << output;
  auto encoder = encoder_t{};
  auto payload = encoder.decode<segurolluvia::schema::payload_t>(
      segurolluvia::schema::bytes_view_t{bytes->data(), bytes->size()});

  EXPECT_EQ(payload.size(), 7u);
  EXPECT_EQ(std::get<std::string>(payload.at("verb")), "buy");
  EXPECT_EQ(std::get<std::string>(payload.at("purchase")), "P-1");
  EXPECT_EQ(std::get<int64_t>(payload.at("bankAccount")), 1234567890123456);
  EXPECT_EQ(std::get<int64_t>(payload.at("refund")), 100);
  EXPECT_FALSE(payload.contains("town"));
}

TEST(payload_builder, address_command_matches_key_derivation) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "payload_builder binary not available: " << builder;
  }

  auto [exit_code, output] =
      run_capture(shell_quote(builder) + " address --purchase P-1");
  ASSERT_EQ(exit_code, 0) << output;

  auto config = segurolluvia::config::make_processor_config();
  EXPECT_EQ(output,
            segurolluvia::schema::to_hex(segurolluvia::schema::key::make_address(
                config.namespace_prefix, "P-1")));
}

TEST(payload_builder, unknown_command_is_usage_error) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "payload_builder binary not available: " << builder;
  }

  auto [exit_code, output] =
      run_capture(shell_quote(builder) + " transmogrify 2>/dev/null");
  EXPECT_EQ(exit_code, 64);
}
