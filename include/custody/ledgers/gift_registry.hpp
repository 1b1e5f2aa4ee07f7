#pragma once

#include <custody/execution/engine.hpp>
#include <custody/schema/operation_result.hpp>
#include <custody/schema/record_view.hpp>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace custody::ledgers {

/// Wish list of priced items. Guests buy an item by paying exactly its
/// price; the proceeds collect in the registry pool until the owner
/// withdraws them.
class gift_registry final {
 public:
  gift_registry(custody::execution::engine& engine, std::string_view pool);

  /// Create the registry pool. Owner only, once.
  custody::schema::operation_result_t initialize(
      const custody::schema::call_context_t& context);

  custody::schema::operation_result_t add_item(
      const custody::schema::call_context_t& context,
      std::string_view id,
      std::string_view name,
      const custody::schema::amount_t& price);

  custody::schema::operation_result_t remove_item(
      const custody::schema::call_context_t& context,
      std::string_view id,
      std::string_view reason);

  /// `context.attached_value` must equal the item price.
  custody::schema::operation_result_t purchase(
      const custody::schema::call_context_t& context,
      std::string_view id);

  custody::schema::operation_result_t withdraw_funds(
      const custody::schema::call_context_t& context,
      const custody::schema::amount_t& amount,
      const custody::schema::principal_id_t& recipient);

  custody::schema::amount_t balance() const;
  std::vector<custody::schema::record_view_t> items(uint64_t offset,
                                                    std::size_t limit) const;
  uint64_t item_count() const;

 private:
  custody::execution::engine& engine_;
  custody::schema::record_key_t pool_;
};

}  // namespace custody::ledgers
