#pragma once

#include <segurolluvia/config/processor_config.hpp>
#include <segurolluvia/schema/purchase_entry.hpp>
#include <segurolluvia/schema/purchase_request.hpp>
#include <segurolluvia/schema/rejection.hpp>
#include <optional>

namespace segurolluvia::execution {

/// Compute the record to store at the request's address.
///
/// `current` is the decoded record already at the address, if any.
/// - buy: inserts a new entry; rejects when the purchase id is present.
/// - calculate: refund minus the request refund, floored at min_refund.
/// - getData: refund plus the request refund, capped at max_refund.
/// The returned record is complete; nothing is written here.
std::optional<segurolluvia::schema::policy_record_t> apply_transition(
    const segurolluvia::schema::purchase_request_t& request,
    std::optional<segurolluvia::schema::policy_record_t> current,
    const segurolluvia::config::processor_config& config,
    segurolluvia::schema::rejection_t& rejection);

}  // namespace segurolluvia::execution
