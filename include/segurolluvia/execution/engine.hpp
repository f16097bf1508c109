#pragma once

#include <segurolluvia/config/processor_config.hpp>
#include <segurolluvia/execution/state_gateway.hpp>
#include <segurolluvia/schema/encoding/scale/encoder.hpp>
#include <segurolluvia/schema/family_info.hpp>
#include <segurolluvia/schema/primitives.hpp>
#include <segurolluvia/schema/query_result.hpp>
#include <segurolluvia/schema/transaction_result.hpp>
#include <mutex>
#include <string_view>
#include <vector>

namespace segurolluvia::execution {

/// Transaction handler for the rain insurance family.
///
/// Decodes a payload, validates it, derives the target address, reads the
/// current record through the state gateway, computes the next record and
/// writes it back. Each call is one transaction; there is no partial write.
class engine final {
 public:
  /// `config` must already be validated and must outlive the engine.
  explicit engine(
      const segurolluvia::schema::encoding::scale_encoder_t& encoder,
      state_gateway gateway,
      const segurolluvia::config::processor_config& config);

  /// Execute one payload against state.
  segurolluvia::schema::transaction_result_t apply(
      const segurolluvia::schema::bytes_view_t& payload);

  /// Execute payloads in order. A failed payload does not stop later ones.
  std::vector<segurolluvia::schema::transaction_result_t> apply_batch(
      const std::vector<segurolluvia::schema::bytes_t>& payloads);

  /// Decode and validate only; state is not read or written.
  segurolluvia::schema::transaction_result_t check_transaction(
      const segurolluvia::schema::bytes_view_t& payload);

  /// Read the entry stored for purchase id.
  segurolluvia::schema::query_result_t query(std::string_view purchase_id);

  /// Family name, supported versions and namespace prefixes.
  segurolluvia::schema::family_info_t info() const;

 private:
  segurolluvia::schema::transaction_result_t apply_locked(
      const segurolluvia::schema::bytes_view_t& payload);

  mutable std::mutex mutex_;
  const segurolluvia::schema::encoding::scale_encoder_t& encoder_;
  state_gateway gateway_;
  const segurolluvia::config::processor_config& config_;
};

}  // namespace segurolluvia::execution
