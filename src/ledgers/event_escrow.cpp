#include <custody/ledgers/event_escrow.hpp>

using namespace custody::schema;

namespace custody::ledgers {

event_escrow::event_escrow(custody::execution::engine& engine)
    : engine_{engine} {}

operation_result_t event_escrow::create_event(
    const call_context_t& context,
    const std::string_view id,
    const uint32_t capacity,
    const amount_t& deposit,
    const duration_milliseconds_t duration,
    const std::string_view name) {
  return engine_.create(context,
                        create_record_t{.kind = record_kind_t::event,
                                        .key = make_bytes(id),
                                        .duration = duration,
                                        .unit_value = deposit,
                                        .capacity = capacity,
                                        .payload = make_bytes(name)});
}

operation_result_t event_escrow::rsvp(const call_context_t& context,
                                      const std::string_view id) {
  return engine_.rsvp(context, rsvp_event_t{.event = make_bytes(id)});
}

operation_result_t event_escrow::check_in(const call_context_t& context,
                                          const std::string_view id,
                                          const principal_id_t& attendee) {
  return engine_.check_in(
      context, check_in_t{.event = make_bytes(id), .attendee = attendee});
}

operation_result_t event_escrow::close_event(const call_context_t& context,
                                             const std::string_view id) {
  return engine_.close_event(context, close_event_t{.event = make_bytes(id)});
}

operation_result_t event_escrow::cancel_event(const call_context_t& context,
                                              const std::string_view id,
                                              const std::string_view reason) {
  return engine_.void_record(
      context,
      void_record_t{.key = make_bytes(id), .reason = std::string{reason}});
}

std::optional<record_view_t> event_escrow::inspect(
    const std::string_view id) const {
  auto view = engine_.inspect(make_bytes(id));
  if (!view || view->kind != record_kind_t::event) {
    return std::nullopt;
  }
  return view;
}

std::optional<record_view_t> event_escrow::attendee(
    const std::string_view id,
    const principal_id_t& principal) const {
  return engine_.inspect(engine_.attendee_key(make_bytes(id), principal));
}

std::vector<record_view_t> event_escrow::attendees(
    const std::string_view id,
    const uint64_t offset,
    const std::size_t limit) const {
  return engine_.list(record_kind_t::attendee, make_bytes(id), offset, limit);
}

}  // namespace custody::ledgers
