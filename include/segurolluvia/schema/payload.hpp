#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>

// Schema type: payload.
// Decoded transaction body: untyped field name to value mapping, checked by
// the field validator before anything touches state.
namespace segurolluvia::schema {

using field_value_t = std::variant<std::string, int64_t>;
using payload_t = std::map<std::string, field_value_t>;

namespace field {

inline constexpr std::string_view kVerb{"verb"};
inline constexpr std::string_view kName{"name"};
inline constexpr std::string_view kMail{"mail"};
inline constexpr std::string_view kBankAccount{"bankAccount"};
inline constexpr std::string_view kPlaceAddress{"placeAddress"};
inline constexpr std::string_view kTown{"town"};
inline constexpr std::string_view kProvince{"province"};
inline constexpr std::string_view kCheckinDate{"checkinDate"};
inline constexpr std::string_view kCheckoutDate{"checkoutDate"};
inline constexpr std::string_view kDays{"days"};
inline constexpr std::string_view kRainAmount{"rainAmount"};
inline constexpr std::string_view kStartHour{"startHour"};
inline constexpr std::string_view kEndHour{"endHour"};
inline constexpr std::string_view kRefund{"refund"};
inline constexpr std::string_view kPurchase{"purchase"};
inline constexpr std::string_view kTotal{"total"};

}  // namespace field

}  // namespace segurolluvia::schema
