#include <segurolluvia/execution/transition.hpp>

#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>
#include <functional>

using namespace segurolluvia::schema;

namespace {

using error_code = segurolluvia::schema::transaction_error_code;
using wide_t = boost::multiprecision::int128_t;

/// Shared range check. Both bounds apply to every operation.
std::optional<uint64_t> bounded_refund(
    const wide_t& value,
    const verb_t verb,
    const segurolluvia::config::processor_config& config,
    rejection_t& rejection) {
  if (value < wide_t{config.min_refund}) {
    rejection.code = error_code::refund_below_minimum;
    rejection.reason =
        fmt::format("Verb is \"{}\", but result would be less than {}",
                    to_string(verb), config.min_refund);
    return std::nullopt;
  }
  if (value > wide_t{config.max_refund}) {
    rejection.code = error_code::refund_above_maximum;
    rejection.reason =
        fmt::format("Verb is \"{}\", but result would be greater than {}",
                    to_string(verb), config.max_refund);
    return std::nullopt;
  }
  return value.convert_to<uint64_t>();
}

std::optional<policy_record_t> apply_create(
    const purchase_request_t& request,
    std::optional<policy_record_t> current,
    const segurolluvia::config::processor_config& config,
    rejection_t& rejection) {
  auto record = current ? std::move(*current) : policy_record_t{};
  if (record.contains(request.purchase)) {
    rejection.code = error_code::purchase_exists;
    rejection.reason = fmt::format(
        "Verb is \"buy\" but Purchase {} already in state", request.purchase);
    return std::nullopt;
  }

  auto refund =
      bounded_refund(wide_t{request.refund}, request.verb, config, rejection);
  if (!refund) {
    return std::nullopt;
  }

  record.emplace(request.purchase,
                 purchase_entry_t{.name = request.name,
                                  .mail = request.mail,
                                  .bank_account = request.bank_account,
                                  .place_address = request.place_address,
                                  .town = request.town,
                                  .province = request.province,
                                  .checkin_date = request.checkin_date,
                                  .checkout_date = request.checkout_date,
                                  .days = request.days,
                                  .rain_amount = request.rain_amount,
                                  .start_hour = request.start_hour,
                                  .end_hour = request.end_hour,
                                  .refund = *refund,
                                  .total = request.total});
  return record;
}

template <typename Operator>
std::optional<policy_record_t> apply_operator(
    const purchase_request_t& request,
    std::optional<policy_record_t> current,
    const segurolluvia::config::processor_config& config,
    rejection_t& rejection,
    Operator op) {
  auto missing = [&] {
    rejection.code = error_code::purchase_not_found;
    rejection.reason =
        fmt::format("Verb is \"{}\" but Purchase {} is not in state",
                    to_string(request.verb), request.purchase);
    return std::nullopt;
  };
  if (!current) {
    return missing();
  }
  auto entry = current->find(request.purchase);
  if (entry == std::end(*current)) {
    return missing();
  }

  auto refund = bounded_refund(
      op(wide_t{entry->second.refund}, wide_t{request.refund}), request.verb,
      config, rejection);
  if (!refund) {
    return std::nullopt;
  }
  entry->second.refund = *refund;
  return current;
}

}  // namespace

namespace segurolluvia::execution {

std::optional<policy_record_t> apply_transition(
    const purchase_request_t& request,
    std::optional<policy_record_t> current,
    const segurolluvia::config::processor_config& config,
    rejection_t& rejection) {
  switch (request.verb) {
    case verb_t::buy:
      return apply_create(request, std::move(current), config, rejection);
    case verb_t::calculate:
      return apply_operator(request, std::move(current), config, rejection,
                            std::minus<wide_t>{});
    case verb_t::get_data:
      return apply_operator(request, std::move(current), config, rejection,
                            std::plus<wide_t>{});
  }
  rejection.code = error_code::verb_unrecognized;
  rejection.reason = "unrecognized verb";
  return std::nullopt;
}

}  // namespace segurolluvia::execution
