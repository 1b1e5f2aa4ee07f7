#include <custody/blake3/hash.hpp>
#include <custody/ledgers/gift_card_ledger.hpp>

using namespace custody::schema;

namespace custody::ledgers {

gift_card_ledger::gift_card_ledger(custody::execution::engine& engine)
    : engine_{engine} {}

operation_result_t gift_card_ledger::create(
    const call_context_t& context,
    const hash32_t& commitment,
    const principal_id_t& beneficiary,
    const duration_milliseconds_t duration,
    const std::string_view message) {
  return engine_.create(context,
                        create_record_t{.kind = record_kind_t::gift_card,
                                        .key = make_bytes(commitment),
                                        .beneficiary = beneficiary,
                                        .duration = duration,
                                        .payload = make_bytes(message)});
}

operation_result_t gift_card_ledger::redeem(const call_context_t& context,
                                            const std::string_view secret,
                                            const std::string_view message) {
  return engine_.redeem(context,
                        redeem_record_t{.secret = make_bytes(secret),
                                        .message = std::string{message}});
}

operation_result_t gift_card_ledger::claim(const call_context_t& context,
                                           const hash32_t& commitment,
                                           const std::string_view message) {
  return engine_.redeem(context,
                        redeem_record_t{.key = make_bytes(commitment),
                                        .message = std::string{message}});
}

operation_result_t gift_card_ledger::cancel(const call_context_t& context,
                                            const std::string_view secret) {
  return engine_.cancel(context,
                        cancel_record_t{.secret = make_bytes(secret)});
}

operation_result_t gift_card_ledger::transfer(
    const call_context_t& context,
    const hash32_t& commitment,
    const principal_id_t& new_beneficiary) {
  return engine_.transfer(
      context, transfer_record_t{.key = make_bytes(commitment),
                                 .new_beneficiary = new_beneficiary});
}

std::optional<record_view_t> gift_card_ledger::inspect(
    const hash32_t& commitment) const {
  auto view = engine_.inspect(make_bytes(commitment));
  if (!view || view->kind != record_kind_t::gift_card) {
    return std::nullopt;
  }
  return view;
}

hash32_t gift_card_ledger::commitment_of(const std::string_view secret) {
  return custody::blake3::hash(secret);
}

}  // namespace custody::ledgers
