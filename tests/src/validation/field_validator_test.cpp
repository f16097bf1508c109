#include <gtest/gtest.h>
#include <segurolluvia/config/processor_config.hpp>
#include <segurolluvia/testing/common.hpp>
#include <segurolluvia/validation/field_validator.hpp>

#include <string>

namespace {

using error_code = segurolluvia::schema::transaction_error_code;

const segurolluvia::config::processor_config& config() {
  static const auto kConfig = segurolluvia::config::make_processor_config();
  return kConfig;
}

segurolluvia::schema::rejection_t rejected(
    const segurolluvia::schema::payload_t& payload) {
  auto rejection = segurolluvia::schema::rejection_t{};
  auto request =
      segurolluvia::validation::validate_payload(payload, config(), rejection);
  EXPECT_FALSE(request.has_value());
  return rejection;
}

}  // namespace

TEST(field_validator, accepts_complete_buy_payload) {
  auto rejection = segurolluvia::schema::rejection_t{};
  auto request = segurolluvia::validation::validate_payload(
      segurolluvia::testing::make_payload("buy", "P-1", 100), config(),
      rejection);
  ASSERT_TRUE(request.has_value());
  EXPECT_EQ(request->verb, segurolluvia::schema::verb_t::buy);
  EXPECT_EQ(request->name, "Ana");
  EXPECT_EQ(request->bank_account, "1234567890123456");
  EXPECT_EQ(request->days, 7);
  EXPECT_EQ(request->refund, 100);
  EXPECT_EQ(request->purchase, "P-1");
  EXPECT_EQ(request->total, "500");
}

TEST(field_validator, maps_get_data_verb) {
  auto rejection = segurolluvia::schema::rejection_t{};
  auto request = segurolluvia::validation::validate_payload(
      segurolluvia::testing::make_payload("getData", "P-1", 5), config(),
      rejection);
  ASSERT_TRUE(request.has_value());
  EXPECT_EQ(request->verb, segurolluvia::schema::verb_t::get_data);
}

TEST(field_validator, verb_is_checked_before_other_fields) {
  auto payload = segurolluvia::testing::make_payload("refund", "P-1", 5);
  payload.erase("name");
  payload["mail"] = std::string{"nobody"};

  auto rejection = rejected(payload);
  EXPECT_EQ(rejection.code, error_code::verb_unrecognized);
  EXPECT_EQ(rejection.reason,
            "Didn't recognize Verb \"refund\". Must be \"buy\", \"calculate\", "
            "or \"getData\"");
}

TEST(field_validator, missing_verb_is_reported) {
  auto payload = segurolluvia::testing::make_payload("buy", "P-1", 5);
  payload.erase("verb");
  EXPECT_EQ(rejected(payload).code, error_code::verb_missing);
}

TEST(field_validator, first_failing_field_wins) {
  auto payload = segurolluvia::testing::make_payload("buy", "P-1", 5);
  payload["mail"] = std::string{"nobody"};
  payload.erase("town");
  payload.erase("total");
  EXPECT_EQ(rejected(payload).code, error_code::mail_invalid);

  payload["mail"] = std::string{"a@x.com"};
  EXPECT_EQ(rejected(payload).code, error_code::town_missing);

  payload["town"] = std::string{"Lugo"};
  EXPECT_EQ(rejected(payload).code, error_code::total_missing);
}

TEST(field_validator, name_length_counts_characters) {
  auto payload = segurolluvia::testing::make_payload("buy", "P-1", 5);
  payload["name"] = std::string(20, 'n');
  auto rejection = segurolluvia::schema::rejection_t{};
  EXPECT_TRUE(segurolluvia::validation::validate_payload(payload, config(),
                                                         rejection)
                  .has_value());

  // Twenty two byte characters.
  auto wide = std::string{};
  for (auto i = 0; i < 20; ++i) {
    wide += "\xC3\xB1";
  }
  payload["name"] = wide;
  EXPECT_TRUE(segurolluvia::validation::validate_payload(payload, config(),
                                                         rejection)
                  .has_value());

  payload["name"] = std::string(21, 'n');
  auto too_long = rejected(payload);
  EXPECT_EQ(too_long.code, error_code::name_too_long);
  EXPECT_EQ(too_long.reason,
            "Name must be a string of no more than 20 characters");
}

TEST(field_validator, empty_name_is_missing) {
  auto payload = segurolluvia::testing::make_payload("buy", "P-1", 5);
  payload["name"] = std::string{};
  EXPECT_EQ(rejected(payload).code, error_code::name_missing);
}

TEST(field_validator, mail_requires_at_sign) {
  auto payload = segurolluvia::testing::make_payload("buy", "P-1", 5);
  payload["mail"] = std::string{"ana.example.com"};
  auto rejection = rejected(payload);
  EXPECT_EQ(rejection.code, error_code::mail_invalid);
  EXPECT_EQ(rejection.reason, "Mail must contain @ character");
}

TEST(field_validator, bank_account_needs_sixteen_digits) {
  auto payload = segurolluvia::testing::make_payload("buy", "P-1", 5);
  payload["bankAccount"] = int64_t{123456789012345};
  EXPECT_EQ(rejected(payload).code, error_code::bank_account_invalid);

  payload["bankAccount"] = int64_t{12345678901234567};
  EXPECT_EQ(rejected(payload).code, error_code::bank_account_invalid);

  payload["bankAccount"] = std::string{"12345678901234ab"};
  EXPECT_EQ(rejected(payload).code, error_code::bank_account_invalid);

  payload["bankAccount"] = std::string{"+1234567890123456"};
  EXPECT_EQ(rejected(payload).code, error_code::bank_account_invalid);

  payload["bankAccount"] = int64_t{-123456789012345};
  EXPECT_EQ(rejected(payload).code, error_code::bank_account_invalid);

  payload["bankAccount"] = std::string{"9999999999999999"};
  auto rejection = segurolluvia::schema::rejection_t{};
  auto request =
      segurolluvia::validation::validate_payload(payload, config(), rejection);
  ASSERT_TRUE(request.has_value());
  EXPECT_EQ(request->bank_account, "9999999999999999");
}

TEST(field_validator, bank_account_keeps_leading_zeros) {
  auto payload = segurolluvia::testing::make_payload("buy", "P-1", 5);
  payload["bankAccount"] = std::string{"0012345678901234"};
  auto rejection = segurolluvia::schema::rejection_t{};
  auto request =
      segurolluvia::validation::validate_payload(payload, config(), rejection);
  ASSERT_TRUE(request.has_value()) << rejection.reason;
  EXPECT_EQ(request->bank_account, "0012345678901234");
}

TEST(field_validator, string_field_rejects_integer_value) {
  auto payload = segurolluvia::testing::make_payload("buy", "P-1", 5);
  payload["province"] = int64_t{15};
  auto rejection = rejected(payload);
  EXPECT_EQ(rejection.code, error_code::field_type_mismatch);
  EXPECT_EQ(rejection.reason, "Province must be a string");
}

TEST(field_validator, integer_fields_accept_numeric_strings) {
  auto payload = segurolluvia::testing::make_payload("buy", "P-1", 5);
  payload["days"] = std::string{"+3"};
  payload["refund"] = std::string{"-40"};
  auto rejection = segurolluvia::schema::rejection_t{};
  auto request =
      segurolluvia::validation::validate_payload(payload, config(), rejection);
  ASSERT_TRUE(request.has_value());
  EXPECT_EQ(request->days, 3);
  EXPECT_EQ(request->refund, -40);
}

TEST(field_validator, integer_fields_reject_text) {
  auto payload = segurolluvia::testing::make_payload("buy", "P-1", 5);
  payload["days"] = std::string{"seven"};
  EXPECT_EQ(rejected(payload).code, error_code::days_invalid);

  payload["days"] = int64_t{7};
  payload["refund"] = std::string{"12.5"};
  auto rejection = rejected(payload);
  EXPECT_EQ(rejection.code, error_code::refund_invalid);
  EXPECT_EQ(rejection.reason, "Refund must be an integer");
}

TEST(field_validator, total_is_stored_as_received) {
  auto payload = segurolluvia::testing::make_payload("buy", "P-1", 5);
  payload["total"] = std::string{"499.99"};
  auto rejection = segurolluvia::schema::rejection_t{};
  auto request =
      segurolluvia::validation::validate_payload(payload, config(), rejection);
  ASSERT_TRUE(request.has_value()) << rejection.reason;
  EXPECT_EQ(request->total, "499.99");

  payload["total"] = std::string{};
  EXPECT_EQ(rejected(payload).code, error_code::total_missing);
}

TEST(field_validator, integer_verb_is_type_mismatch) {
  auto payload = segurolluvia::testing::make_payload("buy", "P-1", 5);
  payload["verb"] = int64_t{0};
  auto rejection = rejected(payload);
  EXPECT_EQ(rejection.code, error_code::field_type_mismatch);
  EXPECT_EQ(rejection.reason, "Verb must be a string");
}

TEST(field_validator, zero_values_are_present) {
  auto payload = segurolluvia::testing::make_payload("calculate", "P-1", 0);
  payload["days"] = int64_t{0};
  payload["total"] = int64_t{0};
  auto rejection = segurolluvia::schema::rejection_t{};
  auto request =
      segurolluvia::validation::validate_payload(payload, config(), rejection);
  ASSERT_TRUE(request.has_value());
  EXPECT_EQ(request->refund, 0);
  EXPECT_EQ(request->total, "0");
}

TEST(field_validator, integer_purchase_becomes_decimal_id) {
  auto payload = segurolluvia::testing::make_payload("buy", "ignored", 5);
  payload["purchase"] = int64_t{42};
  auto rejection = segurolluvia::schema::rejection_t{};
  auto request =
      segurolluvia::validation::validate_payload(payload, config(), rejection);
  ASSERT_TRUE(request.has_value());
  EXPECT_EQ(request->purchase, "42");

  payload["purchase"] = std::string{};
  EXPECT_EQ(rejected(payload).code, error_code::purchase_missing);
}

TEST(field_validator, every_verb_requires_every_field) {
  auto payload = segurolluvia::testing::make_payload("getData", "P-1", 5);
  payload.erase("startHour");
  auto rejection = rejected(payload);
  EXPECT_EQ(rejection.code, error_code::start_hour_missing);
  EXPECT_EQ(rejection.reason, "Start hour is required");
}
