#pragma once

#include <custody/execution/engine.hpp>
#include <custody/schema/operation_result.hpp>
#include <custody/schema/record_view.hpp>
#include <optional>
#include <string_view>

namespace custody::ledgers {

/// Hash-locked gift cards. The sender funds a card under blake3(secret);
/// whoever presents the secret (or the named beneficiary) redeems it, and the
/// sender may take the funds back with `cancel` while it is unredeemed.
class gift_card_ledger final {
 public:
  explicit gift_card_ledger(custody::execution::engine& engine);

  /// Fund a card with `context.attached_value`. A null beneficiary leaves the
  /// card bearer-only; `duration` of zero means the card never expires.
  custody::schema::operation_result_t create(
      const custody::schema::call_context_t& context,
      const custody::schema::hash32_t& commitment,
      const custody::schema::principal_id_t& beneficiary,
      custody::schema::duration_milliseconds_t duration,
      std::string_view message);

  custody::schema::operation_result_t redeem(
      const custody::schema::call_context_t& context,
      std::string_view secret,
      std::string_view message);

  /// Beneficiary redemption without the secret.
  custody::schema::operation_result_t claim(
      const custody::schema::call_context_t& context,
      const custody::schema::hash32_t& commitment,
      std::string_view message);

  custody::schema::operation_result_t cancel(
      const custody::schema::call_context_t& context,
      std::string_view secret);

  custody::schema::operation_result_t transfer(
      const custody::schema::call_context_t& context,
      const custody::schema::hash32_t& commitment,
      const custody::schema::principal_id_t& new_beneficiary);

  std::optional<custody::schema::record_view_t> inspect(
      const custody::schema::hash32_t& commitment) const;

  static custody::schema::hash32_t commitment_of(std::string_view secret);

 private:
  custody::execution::engine& engine_;
};

}  // namespace custody::ledgers
