#include <segurolluvia/validation/field_validator.hpp>

#include <fmt/format.h>
#include <algorithm>
#include <charconv>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

using namespace segurolluvia::schema;

namespace {

using error_code = segurolluvia::schema::transaction_error_code;

const field_value_t* find_field(const payload_t& payload,
                                const std::string_view name) {
  auto it = payload.find(std::string{name});
  if (it == std::end(payload)) {
    return nullptr;
  }
  return &it->second;
}

bool reject(rejection_t& rejection, const error_code code, std::string reason) {
  rejection.code = code;
  rejection.reason = std::move(reason);
  return false;
}

/// Parse the whole string as a signed decimal integer.
std::optional<int64_t> parse_integer(const std::string_view text) {
  auto value = int64_t{};
  auto begin = text.data();
  auto end = text.data() + text.size();
  if (begin != end && *begin == '+') {
    ++begin;
  }
  if (begin == end) {
    return std::nullopt;
  }
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

std::optional<int64_t> to_integer(const field_value_t& value) {
  if (const auto* number = std::get_if<int64_t>(&value)) {
    return *number;
  }
  return parse_integer(std::get<std::string>(value));
}

std::size_t count_code_points(const std::string_view text) {
  auto count = std::size_t{0};
  for (const auto ch : text) {
    if ((static_cast<unsigned char>(ch) & 0xC0u) != 0x80u) {
      ++count;
    }
  }
  return count;
}

bool read_string(const payload_t& payload,
                 const std::string_view field_name,
                 const std::string_view label,
                 const error_code missing,
                 std::string& out,
                 rejection_t& rejection) {
  const auto* value = find_field(payload, field_name);
  if (value == nullptr) {
    return reject(rejection, missing, fmt::format("{} is required", label));
  }
  const auto* text = std::get_if<std::string>(value);
  if (text == nullptr) {
    return reject(rejection, error_code::field_type_mismatch,
                  fmt::format("{} must be a string", label));
  }
  if (text->empty()) {
    return reject(rejection, missing, fmt::format("{} is required", label));
  }
  out = *text;
  return true;
}

bool read_integer(const payload_t& payload,
                  const std::string_view field_name,
                  const std::string_view label,
                  const error_code missing,
                  const error_code invalid,
                  int64_t& out,
                  rejection_t& rejection) {
  const auto* value = find_field(payload, field_name);
  if (value == nullptr) {
    return reject(rejection, missing, fmt::format("{} is required", label));
  }
  auto parsed = to_integer(*value);
  if (!parsed) {
    return reject(rejection, invalid,
                  fmt::format("{} must be an integer", label));
  }
  out = *parsed;
  return true;
}

bool read_verb(const payload_t& payload, verb_t& out, rejection_t& rejection) {
  const auto* value = find_field(payload, field::kVerb);
  if (value == nullptr) {
    return reject(rejection, error_code::verb_missing, "Verb is required");
  }
  const auto* text = std::get_if<std::string>(value);
  if (text == nullptr) {
    return reject(rejection, error_code::field_type_mismatch,
                  "Verb must be a string");
  }
  if (text->empty()) {
    return reject(rejection, error_code::verb_missing, "Verb is required");
  }
  auto verb = try_parse_verb(*text);
  if (!verb) {
    return reject(
        rejection, error_code::verb_unrecognized,
        fmt::format("Didn't recognize Verb \"{}\". Must be \"buy\", "
                    "\"calculate\", or \"getData\"",
                    *text));
  }
  out = *verb;
  return true;
}

bool read_name(const payload_t& payload,
               const segurolluvia::config::processor_config& config,
               std::string& out,
               rejection_t& rejection) {
  if (!read_string(payload, field::kName, "Name", error_code::name_missing,
                   out, rejection)) {
    return false;
  }
  if (count_code_points(out) > config.max_name_length) {
    return reject(rejection, error_code::name_too_long,
                  fmt::format("Name must be a string of no more than {} "
                              "characters",
                              config.max_name_length));
  }
  return true;
}

bool read_mail(const payload_t& payload,
               std::string& out,
               rejection_t& rejection) {
  if (!read_string(payload, field::kMail, "Mail", error_code::mail_missing,
                   out, rejection)) {
    return false;
  }
  if (out.find('@') == std::string::npos) {
    return reject(rejection, error_code::mail_invalid,
                  "Mail must contain @ character");
  }
  return true;
}

/// Integer values are rendered in decimal; text is kept as sent.
std::string render(const field_value_t& value) {
  if (const auto* number = std::get_if<int64_t>(&value)) {
    return std::to_string(*number);
  }
  return std::get<std::string>(value);
}

bool read_bank_account(const payload_t& payload,
                       const segurolluvia::config::processor_config& config,
                       std::string& out,
                       rejection_t& rejection) {
  const auto* value = find_field(payload, field::kBankAccount);
  if (value == nullptr) {
    return reject(rejection, error_code::bank_account_missing,
                  "Bank account is required");
  }
  auto account = render(*value);
  auto digits_only =
      std::all_of(std::begin(account), std::end(account), [](const char ch) {
        return ch >= '0' && ch <= '9';
      });
  if (account.size() != config.bank_account_digits || !digits_only) {
    return reject(rejection, error_code::bank_account_invalid,
                  fmt::format("Bank account must be an integer of {} digits",
                              config.bank_account_digits));
  }
  out = std::move(account);
  return true;
}

/// Presence only. Used for identifiers and amounts stored verbatim.
bool read_present(const payload_t& payload,
                  const std::string_view field_name,
                  const std::string_view label,
                  const error_code missing,
                  std::string& out,
                  rejection_t& rejection) {
  const auto* value = find_field(payload, field_name);
  if (value == nullptr) {
    return reject(rejection, missing, fmt::format("{} is required", label));
  }
  auto text = render(*value);
  if (text.empty()) {
    return reject(rejection, missing, fmt::format("{} is required", label));
  }
  out = std::move(text);
  return true;
}

}  // namespace

namespace segurolluvia::validation {

std::optional<purchase_request_t> validate_payload(
    const payload_t& payload,
    const segurolluvia::config::processor_config& config,
    rejection_t& rejection) {
  auto request = purchase_request_t{};
  auto valid =
      read_verb(payload, request.verb, rejection) &&
      read_name(payload, config, request.name, rejection) &&
      read_mail(payload, request.mail, rejection) &&
      read_bank_account(payload, config, request.bank_account, rejection) &&
      read_string(payload, field::kPlaceAddress, "Place address",
                  error_code::place_address_missing, request.place_address,
                  rejection) &&
      read_string(payload, field::kTown, "Town", error_code::town_missing,
                  request.town, rejection) &&
      read_string(payload, field::kProvince, "Province",
                  error_code::province_missing, request.province,
                  rejection) &&
      read_string(payload, field::kCheckinDate, "Checkin date",
                  error_code::checkin_date_missing, request.checkin_date,
                  rejection) &&
      read_string(payload, field::kCheckoutDate, "Checkout date",
                  error_code::checkout_date_missing, request.checkout_date,
                  rejection) &&
      read_integer(payload, field::kDays, "Days", error_code::days_missing,
                   error_code::days_invalid, request.days, rejection) &&
      read_string(payload, field::kRainAmount, "Rain amount",
                  error_code::rain_amount_missing, request.rain_amount,
                  rejection) &&
      read_string(payload, field::kStartHour, "Start hour",
                  error_code::start_hour_missing, request.start_hour,
                  rejection) &&
      read_string(payload, field::kEndHour, "End hour",
                  error_code::end_hour_missing, request.end_hour,
                  rejection) &&
      read_integer(payload, field::kRefund, "Refund",
                   error_code::refund_missing, error_code::refund_invalid,
                   request.refund, rejection) &&
      read_present(payload, field::kPurchase, "Purchase number",
                   error_code::purchase_missing, request.purchase,
                   rejection) &&
      read_present(payload, field::kTotal, "Total price",
                   error_code::total_missing, request.total, rejection);
  if (!valid) {
    return std::nullopt;
  }
  return request;
}

}  // namespace segurolluvia::validation
