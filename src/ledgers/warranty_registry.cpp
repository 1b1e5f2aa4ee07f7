#include <spdlog/spdlog.h>
#include <custody/ledgers/warranty_registry.hpp>
#include <limits>

using namespace custody::schema;

namespace custody::ledgers {

warranty_registry::warranty_registry(custody::execution::engine& engine)
    : engine_{engine} {}

operation_result_t warranty_registry::issue(const call_context_t& context,
                                            const std::string_view serial,
                                            const principal_id_t& customer,
                                            const uint64_t days,
                                            const std::string_view details) {
  if (days > std::numeric_limits<duration_milliseconds_t>::max() /
                 kMillisecondsPerDay) {
    spdlog::warn("Warranty {} rejected: {} days is out of range", serial,
                 days);
    return operation_result_t{.code = error_code_t::invalid_input,
                              .log = "warranty duration is out of range",
                              .codespace = "custody.create"};
  }
  return engine_.create(
      context, create_record_t{.kind = record_kind_t::warranty,
                               .key = make_bytes(serial),
                               .beneficiary = customer,
                               .duration = days * kMillisecondsPerDay,
                               .payload = make_bytes(details)});
}

operation_result_t warranty_registry::transfer(const call_context_t& context,
                                               const std::string_view serial,
                                               const principal_id_t& new_owner) {
  return engine_.transfer(context,
                          transfer_record_t{.key = make_bytes(serial),
                                            .new_beneficiary = new_owner});
}

operation_result_t warranty_registry::void_warranty(
    const call_context_t& context,
    const std::string_view serial,
    const std::string_view reason) {
  return engine_.void_record(
      context, void_record_t{.key = make_bytes(serial),
                             .reason = std::string{reason}});
}

std::optional<record_view_t> warranty_registry::inspect(
    const std::string_view serial) const {
  auto view = engine_.inspect(make_bytes(serial));
  if (!view || view->kind != record_kind_t::warranty) {
    return std::nullopt;
  }
  return view;
}

std::vector<history_entry_t> warranty_registry::history(
    const std::size_t n) const {
  return engine_.recent_history(n);
}

}  // namespace custody::ledgers
