#include <custody/ledgers/gift_registry.hpp>

using namespace custody::schema;

namespace custody::ledgers {

gift_registry::gift_registry(custody::execution::engine& engine,
                             const std::string_view pool)
    : engine_{engine}, pool_{make_bytes(pool)} {}

operation_result_t gift_registry::initialize(const call_context_t& context) {
  return engine_.create(context,
                        create_record_t{.kind = record_kind_t::pool,
                                        .key = pool_,
                                        .access = access_policy_t::owner_only});
}

operation_result_t gift_registry::add_item(const call_context_t& context,
                                           const std::string_view id,
                                           const std::string_view name,
                                           const amount_t& price) {
  return engine_.create(context,
                        create_record_t{.kind = record_kind_t::registry_item,
                                        .key = make_bytes(id),
                                        .unit_value = price,
                                        .parent = pool_,
                                        .payload = make_bytes(name)});
}

operation_result_t gift_registry::remove_item(const call_context_t& context,
                                              const std::string_view id,
                                              const std::string_view reason) {
  return engine_.void_record(
      context,
      void_record_t{.key = make_bytes(id), .reason = std::string{reason}});
}

operation_result_t gift_registry::purchase(const call_context_t& context,
                                           const std::string_view id) {
  return engine_.purchase(context, purchase_item_t{.key = make_bytes(id)});
}

operation_result_t gift_registry::withdraw_funds(
    const call_context_t& context,
    const amount_t& amount,
    const principal_id_t& recipient) {
  return engine_.withdraw(context, withdraw_funds_t{.pool = pool_,
                                                    .amount = amount,
                                                    .recipient = recipient,
                                                    .reason = "registry"});
}

amount_t gift_registry::balance() const {
  auto view = engine_.inspect(pool_);
  return view ? view->value : amount_t{0};
}

std::vector<record_view_t> gift_registry::items(const uint64_t offset,
                                                const std::size_t limit) const {
  return engine_.list(record_kind_t::registry_item, pool_, offset, limit);
}

uint64_t gift_registry::item_count() const {
  return engine_.count(record_kind_t::registry_item, pool_);
}

}  // namespace custody::ledgers
