#include <custody/ledgers/shared_treasury.hpp>

using namespace custody::schema;

namespace custody::ledgers {

shared_treasury::shared_treasury(custody::execution::engine& engine,
                                 const std::string_view pool)
    : engine_{engine}, pool_{make_bytes(pool)} {}

operation_result_t shared_treasury::initialize(const call_context_t& context) {
  return engine_.create(context,
                        create_record_t{.kind = record_kind_t::pool,
                                        .key = pool_,
                                        .access = access_policy_t::members});
}

operation_result_t shared_treasury::add_member(const call_context_t& context,
                                               const principal_id_t& member) {
  return engine_.add_member(context, member);
}

operation_result_t shared_treasury::remove_member(
    const call_context_t& context,
    const principal_id_t& member) {
  return engine_.remove_member(context, member);
}

bool shared_treasury::is_member(const principal_id_t& principal) const {
  return engine_.is_member(principal);
}

operation_result_t shared_treasury::deposit(const call_context_t& context) {
  return engine_.deposit(context, deposit_funds_t{.pool = pool_});
}

operation_result_t shared_treasury::withdraw(const call_context_t& context,
                                             const amount_t& amount,
                                             const principal_id_t& recipient,
                                             const std::string_view reason) {
  return engine_.withdraw(context,
                          withdraw_funds_t{.pool = pool_,
                                           .amount = amount,
                                           .recipient = recipient,
                                           .reason = std::string{reason}});
}

std::vector<history_entry_t> shared_treasury::recent_history(
    const std::size_t n) const {
  return engine_.recent_history(n);
}

amount_t shared_treasury::balance() const {
  auto view = engine_.inspect(pool_);
  return view ? view->value : amount_t{0};
}

}  // namespace custody::ledgers
