#pragma once

#include <segurolluvia/config/processor_config.hpp>
#include <segurolluvia/schema/payload.hpp>
#include <segurolluvia/schema/purchase_request.hpp>
#include <segurolluvia/schema/rejection.hpp>
#include <optional>

namespace segurolluvia::validation {

/// Type and format check of a decoded payload.
///
/// Fields are checked in a fixed order (verb, name, mail, bankAccount,
/// placeAddress, town, province, checkinDate, checkoutDate, days,
/// rainAmount, startHour, endHour, refund, purchase, total) and the first
/// violation is reported through `rejection`. Every verb requires every
/// field. Pure; does not look at state.
std::optional<segurolluvia::schema::purchase_request_t> validate_payload(
    const segurolluvia::schema::payload_t& payload,
    const segurolluvia::config::processor_config& config,
    segurolluvia::schema::rejection_t& rejection);

}  // namespace segurolluvia::validation
