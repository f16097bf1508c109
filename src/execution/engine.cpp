#include <spdlog/spdlog.h>
#include <segurolluvia/execution/engine.hpp>
#include <segurolluvia/execution/transition.hpp>
#include <segurolluvia/schema/key/address.hpp>
#include <segurolluvia/schema/payload.hpp>
#include <segurolluvia/validation/field_validator.hpp>
#include <string>
#include <utility>

using namespace segurolluvia::schema;

namespace {

using encoder_t = segurolluvia::schema::encoding::scale_encoder_t;

transaction_result_t make_internal_error(const transaction_error_code code,
                                         std::string log,
                                         std::string info = {}) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{kInternalCodespace};
  return result;
}

transaction_result_t make_rejection(const rejection_t& rejection,
                                    const std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(rejection.code);
  result.log = "invalid transaction";
  result.info = rejection.reason;
  result.codespace = std::string{codespace};
  return result;
}

std::optional<payload_t> decode_payload(const encoder_t& encoder,
                                        const bytes_view_t& raw,
                                        std::string& error) {
  if (raw.empty()) {
    error = "empty payload";
    return std::nullopt;
  }
  auto decoded = encoder.try_decode<payload_t>(raw);
  if (!decoded) {
    error = "payload is not a valid SCALE field map";
  }
  return decoded;
}

transaction_event_t make_event(const purchase_request_t& request,
                               const address_t& address,
                               const purchase_entry_t& entry) {
  return transaction_event_t{
      .type = std::string{event_type(request.verb)},
      .attributes = {
          event_attribute_t{
              .key = "purchase", .value = request.purchase, .index = true},
          event_attribute_t{
              .key = "address", .value = to_hex(address), .index = true},
          event_attribute_t{.key = "refund",
                            .value = std::to_string(entry.refund),
                            .index = false}}};
}

void log_summary(const purchase_request_t& request) {
  spdlog::info(
      "Verb: {}\nName: {}\nMail: {}\nBankAccount: {}\nPlaceAddress: {}\n"
      "Town: {}\nProvince: {}\nCheckinDate: {}\nCheckoutDate: {}\nDays: {}\n"
      "RainAmount: {}\nStartHour: {}\nEndHour: {}\nRefund: {}\n"
      "Purchase: {}\nTotal: {}\n----------------------",
      to_string(request.verb), request.name, request.mail,
      request.bank_account, request.place_address, request.town,
      request.province, request.checkin_date, request.checkout_date,
      request.days, request.rain_amount, request.start_hour, request.end_hour,
      request.refund, request.purchase, request.total);
}

}  // namespace

namespace segurolluvia::execution {

engine::engine(const encoder_t& encoder,
               state_gateway gateway,
               const segurolluvia::config::processor_config& config)
    : encoder_{encoder}, gateway_{std::move(gateway)}, config_{config} {
  spdlog::info("Transaction handler ready: family '{}' version {} namespace {}",
               config_.family_name, config_.family_version,
               key::to_hex(config_.namespace_prefix));
}

transaction_result_t engine::apply(const bytes_view_t& payload) {
  auto lock = std::scoped_lock{mutex_};
  return apply_locked(payload);
}

std::vector<transaction_result_t> engine::apply_batch(
    const std::vector<bytes_t>& payloads) {
  auto lock = std::scoped_lock{mutex_};
  auto results = std::vector<transaction_result_t>{};
  results.reserve(payloads.size());
  for (const auto& payload : payloads) {
    results.push_back(
        apply_locked(bytes_view_t{payload.data(), payload.size()}));
  }
  return results;
}

transaction_result_t engine::check_transaction(const bytes_view_t& payload) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto decoded = decode_payload(encoder_, payload, decode_error);
  if (!decoded) {
    spdlog::error("Payload decode failed: {}", decode_error);
    return make_internal_error(transaction_error_code::payload_decode_failed,
                               "payload decode failed", decode_error);
  }
  auto rejection = rejection_t{};
  auto request =
      segurolluvia::validation::validate_payload(*decoded, config_, rejection);
  if (!request) {
    spdlog::debug("Check rejected payload: {}", rejection.reason);
    return make_rejection(rejection, kValidationCodespace);
  }
  auto result = transaction_result_t{};
  result.info = std::string{to_string(request->verb)} + " accepted";
  return result;
}

transaction_result_t engine::apply_locked(const bytes_view_t& payload) {
  auto decode_error = std::string{};
  auto decoded = decode_payload(encoder_, payload, decode_error);
  if (!decoded) {
    spdlog::error("Payload decode failed: {}", decode_error);
    return make_internal_error(transaction_error_code::payload_decode_failed,
                               "payload decode failed", decode_error);
  }

  auto rejection = rejection_t{};
  auto request =
      segurolluvia::validation::validate_payload(*decoded, config_, rejection);
  if (!request) {
    spdlog::warn("Rejected payload: {}", rejection.reason);
    return make_rejection(rejection, kValidationCodespace);
  }

  auto address = key::make_address(config_.namespace_prefix, request->purchase);
  spdlog::debug("Purchase {} maps to address {}", request->purchase,
                to_hex(address));

  auto current = std::optional<policy_record_t>{};
  auto stored = gateway_.get(address);
  if (stored && !stored->empty()) {
    current = encoder_.try_decode<policy_record_t>(
        bytes_view_t{stored->data(), stored->size()});
    if (!current) {
      spdlog::error("Stored record at {} does not decode", to_hex(address));
      return make_internal_error(transaction_error_code::state_decode_failed,
                                 "state decode failed", to_hex(address));
    }
  }

  auto next = apply_transition(*request, std::move(current), config_, rejection);
  if (!next) {
    spdlog::warn("Rejected {} for purchase {}: {}", to_string(request->verb),
                 request->purchase, rejection.reason);
    return make_rejection(rejection, kTransitionCodespace);
  }

  auto encoded = encoder_.encode(*next);
  auto written =
      gateway_.set(address, bytes_view_t{encoded.data(), encoded.size()});
  if (written.empty()) {
    spdlog::error("State write reported no addresses for {}", to_hex(address));
    return make_internal_error(transaction_error_code::state_write_failed,
                               "State error!", to_hex(address));
  }

  log_summary(*request);
  auto result = transaction_result_t{};
  result.info = std::string{to_string(request->verb)} + " applied";
  result.data = bytes_t{std::begin(address), std::end(address)};
  result.events.push_back(make_event(*request, address,
                                     next->at(request->purchase)));
  return result;
}

query_result_t engine::query(std::string_view purchase_id) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.key = key::make_address(config_.namespace_prefix, purchase_id);
  result.codespace = "segurolluvia.query";

  auto stored = gateway_.get(result.key);
  if (!stored || stored->empty()) {
    result.code = static_cast<uint32_t>(query_error_code::not_found);
    result.log = "purchase not found";
    return result;
  }
  auto record = encoder_.try_decode<policy_record_t>(
      bytes_view_t{stored->data(), stored->size()});
  if (!record) {
    spdlog::error("Stored record at {} does not decode", to_hex(result.key));
    result.code = static_cast<uint32_t>(query_error_code::state_decode_failed);
    result.log = "state decode failed";
    return result;
  }
  auto entry = record->find(std::string{purchase_id});
  if (entry == std::end(*record)) {
    result.code = static_cast<uint32_t>(query_error_code::not_found);
    result.log = "purchase not found";
    return result;
  }
  result.value = encoder_.encode(entry->second);
  return result;
}

family_info_t engine::info() const {
  auto info = family_info_t{};
  info.family_name = config_.family_name;
  info.family_versions = {config_.family_version};
  info.namespaces = {key::to_hex(config_.namespace_prefix)};
  return info;
}

}  // namespace segurolluvia::execution
