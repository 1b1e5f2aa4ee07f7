#pragma once

#include <custody/execution/collaborators.hpp>
#include <custody/execution/ledger_store.hpp>
#include <custody/schema/error_code.hpp>
#include <custody/schema/primitives.hpp>
#include <custody/schema/record_state.hpp>

namespace custody::execution {

/// Moves value in and out of custody.
///
/// `payout` writes the debited record (the effect) before it calls the value
/// transfer (the interaction). A re-entrant call made by the recipient during
/// the transfer reads the debited record and cannot be paid again. When the
/// transfer fails the caller's scope is rolled back, so effect and transfer
/// commit together or not at all.
///
/// At most one transfer is outstanding per ledger. A re-entrant operation may
/// change ledger state but any payout it attempts fails with
/// `transfer_failed`; otherwise a later rollback of the outer operation could
/// restore a balance that had already been paid out.
class disbursement final {
 public:
  disbursement(ledger_store& store, value_transfer_t transfer);

  /// Credit `amount` to `record` and to the ledger's custodied total.
  void credit(custody::schema::record_state_t& record,
              const custody::schema::amount_t& amount);

  /// Debit `amount` from `record` and the custodied total. Fails with
  /// `invalid_state` when the record holds less than `amount`.
  custody::schema::error_code_t debit(custody::schema::record_state_t& record,
                                      const custody::schema::amount_t& amount);

  /// Invoke the value-transfer substrate. Refused while another transfer is
  /// in flight.
  custody::schema::error_code_t transfer(
      const custody::schema::principal_id_t& recipient,
      const custody::schema::amount_t& amount);

  /// Debit, then transfer.
  custody::schema::error_code_t payout(
      custody::schema::record_state_t& record,
      const custody::schema::amount_t& amount,
      const custody::schema::principal_id_t& recipient);

 private:
  ledger_store& store_;
  value_transfer_t transfer_;
  bool in_flight_{false};
};

}  // namespace custody::execution
