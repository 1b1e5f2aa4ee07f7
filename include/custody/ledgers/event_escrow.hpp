#pragma once

#include <custody/execution/engine.hpp>
#include <custody/schema/operation_result.hpp>
#include <custody/schema/record_view.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace custody::ledgers {

/// RSVP escrow. Guests stake a fixed deposit to reserve one of `capacity`
/// places before the deadline; the organizer (ledger owner) refunds each
/// guest on check-in and keeps the deposits of no-shows when closing.
class event_escrow final {
 public:
  explicit event_escrow(custody::execution::engine& engine);

  custody::schema::operation_result_t create_event(
      const custody::schema::call_context_t& context,
      std::string_view id,
      uint32_t capacity,
      const custody::schema::amount_t& deposit,
      custody::schema::duration_milliseconds_t duration,
      std::string_view name);

  /// `context.attached_value` must equal the deposit.
  custody::schema::operation_result_t rsvp(
      const custody::schema::call_context_t& context,
      std::string_view id);

  custody::schema::operation_result_t check_in(
      const custody::schema::call_context_t& context,
      std::string_view id,
      const custody::schema::principal_id_t& attendee);

  custody::schema::operation_result_t close_event(
      const custody::schema::call_context_t& context,
      std::string_view id);

  custody::schema::operation_result_t cancel_event(
      const custody::schema::call_context_t& context,
      std::string_view id,
      std::string_view reason);

  std::optional<custody::schema::record_view_t> inspect(
      std::string_view id) const;
  std::optional<custody::schema::record_view_t> attendee(
      std::string_view id,
      const custody::schema::principal_id_t& principal) const;
  std::vector<custody::schema::record_view_t> attendees(
      std::string_view id,
      uint64_t offset,
      std::size_t limit) const;

 private:
  custody::execution::engine& engine_;
};

}  // namespace custody::ledgers
