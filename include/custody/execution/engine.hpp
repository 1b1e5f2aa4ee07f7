#pragma once

#include <custody/execution/access_control.hpp>
#include <custody/execution/collaborators.hpp>
#include <custody/execution/disbursement.hpp>
#include <custody/execution/event_log.hpp>
#include <custody/execution/ledger_store.hpp>
#include <custody/schema/call_context.hpp>
#include <custody/schema/cancel_record.hpp>
#include <custody/schema/check_in.hpp>
#include <custody/schema/close_event.hpp>
#include <custody/schema/create_record.hpp>
#include <custody/schema/deposit_funds.hpp>
#include <custody/schema/history_entry.hpp>
#include <custody/schema/ledger_event.hpp>
#include <custody/schema/operation_result.hpp>
#include <custody/schema/primitives.hpp>
#include <custody/schema/purchase_item.hpp>
#include <custody/schema/record_view.hpp>
#include <custody/schema/redeem_record.hpp>
#include <custody/schema/rsvp_event.hpp>
#include <custody/schema/transfer_record.hpp>
#include <custody/schema/void_record.hpp>
#include <custody/schema/withdraw_funds.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace custody::execution {

/// Runtime options of one ledger instance.
struct engine_options final {
  /// Namespace of every key this ledger writes.
  custody::schema::ledger_id_t ledger_id{};
  /// Owner installed when the ledger is opened for the first time.
  custody::schema::principal_id_t owner{};
  /// Upper bound on the page size of listing and history reads.
  std::size_t history_page_limit{100};
};

/// Custody and conditional-release engine for one ledger.
///
/// Every mutating operation runs as one logical transaction: authorization,
/// precondition checks against the store and clock, effects, at most one
/// outward value transfer, then history and events. A rejected operation
/// (including a failed transfer) leaves no trace. Operations are serialized;
/// the value transfer may re-enter the engine on the calling thread, and the
/// re-entered operation observes the effects already staged by its caller.
class engine final {
 public:
  engine(encoder_t& encoder,
         storage_t& storage,
         engine_options options,
         clock_source_t clock,
         value_transfer_t transfer);

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  custody::schema::operation_result_t transfer_ownership(
      const custody::schema::call_context_t& context,
      const custody::schema::principal_id_t& new_owner);
  custody::schema::operation_result_t add_member(
      const custody::schema::call_context_t& context,
      const custody::schema::principal_id_t& member);
  custody::schema::operation_result_t remove_member(
      const custody::schema::call_context_t& context,
      const custody::schema::principal_id_t& member);

  /// Nonexistent -> active.
  custody::schema::operation_result_t create(
      const custody::schema::call_context_t& context,
      const custody::schema::create_record_t& op);

  /// Change the beneficiary of a live warranty or gift card.
  custody::schema::operation_result_t transfer(
      const custody::schema::call_context_t& context,
      const custody::schema::transfer_record_t& op);

  /// Active -> voided. Owner only; never pays out.
  custody::schema::operation_result_t void_record(
      const custody::schema::call_context_t& context,
      const custody::schema::void_record_t& op);

  /// Active -> redeemed for a hash-locked record, by secret or beneficiary.
  custody::schema::operation_result_t redeem(
      const custody::schema::call_context_t& context,
      const custody::schema::redeem_record_t& op);

  /// Active -> cancelled; refunds the depositor.
  custody::schema::operation_result_t cancel(
      const custody::schema::call_context_t& context,
      const custody::schema::cancel_record_t& op);

  custody::schema::operation_result_t deposit(
      const custody::schema::call_context_t& context,
      const custody::schema::deposit_funds_t& op);
  custody::schema::operation_result_t withdraw(
      const custody::schema::call_context_t& context,
      const custody::schema::withdraw_funds_t& op);
  custody::schema::operation_result_t purchase(
      const custody::schema::call_context_t& context,
      const custody::schema::purchase_item_t& op);

  custody::schema::operation_result_t rsvp(
      const custody::schema::call_context_t& context,
      const custody::schema::rsvp_event_t& op);
  custody::schema::operation_result_t check_in(
      const custody::schema::call_context_t& context,
      const custody::schema::check_in_t& op);
  /// After the event deadline, forfeit unrefunded deposits to the organizer.
  custody::schema::operation_result_t close_event(
      const custody::schema::call_context_t& context,
      const custody::schema::close_event_t& op);

  custody::schema::principal_id_t owner() const;
  bool is_member(const custody::schema::principal_id_t& principal) const;

  std::optional<custody::schema::record_view_t> inspect(
      const custody::schema::record_key_t& key) const;

  /// Page through records of one kind (and parent), or all records when
  /// `kind` is empty. `limit` is capped by the configured page limit.
  std::vector<custody::schema::record_view_t> list(
      std::optional<custody::schema::record_kind_t> kind,
      const std::optional<custody::schema::record_key_t>& parent,
      uint64_t offset,
      std::size_t limit) const;
  uint64_t count(std::optional<custody::schema::record_kind_t> kind,
                 const std::optional<custody::schema::record_key_t>& parent)
      const;

  std::vector<custody::schema::history_entry_t> recent_history(
      std::size_t n) const;
  std::vector<custody::schema::history_entry_t> history_page(
      uint64_t offset,
      std::size_t limit) const;
  uint64_t history_size() const;

  std::vector<custody::schema::ledger_event_t> events(uint64_t from_id,
                                                      uint64_t to_id) const;
  void subscribe(event_sink_t sink);

  /// Running total of value held in custody.
  custody::schema::amount_t custodied_total() const;
  /// Sum of `value` over every record; equals custodied_total().
  custody::schema::amount_t reconcile() const;

  custody::schema::record_key_t attendee_key(
      const custody::schema::record_key_t& event,
      const custody::schema::principal_id_t& attendee) const;

  const engine_options& options() const;

 private:
  using step_t =
      std::function<custody::schema::error_code_t(
          custody::schema::operation_result_t&)>;

  custody::schema::operation_result_t run(std::string_view codespace,
                                          const step_t& step);

  void emit(custody::schema::operation_result_t& result,
            custody::schema::event_kind_t kind,
            const custody::schema::record_key_t& key,
            const custody::schema::principal_id_t& actor,
            const custody::schema::principal_id_t& counterparty,
            const custody::schema::amount_t& amount,
            std::string reason,
            custody::schema::timestamp_milliseconds_t now);

  /// Key addressed by a secret and/or an explicit key. `proven` reports
  /// whether the caller demonstrated knowledge of the secret.
  custody::schema::error_code_t resolve_key(
      custody::schema::operation_result_t& result,
      const custody::schema::bytes_t& secret,
      const std::optional<custody::schema::record_key_t>& key,
      custody::schema::record_key_t& resolved,
      bool& proven) const;

  bool is_expired(const custody::schema::record_state_t& record,
                  custody::schema::timestamp_milliseconds_t now) const;
  custody::schema::record_view_t make_view(
      const custody::schema::record_state_t& record,
      custody::schema::timestamp_milliseconds_t now) const;

  mutable std::recursive_mutex mutex_;
  engine_options options_;
  encoder_t& encoder_;
  clock_source_t clock_;
  ledger_store store_;
  access_control access_;
  disbursement disbursement_;
  event_log events_;
};

}  // namespace custody::execution
