#pragma once

#include <custody/execution/engine.hpp>
#include <custody/schema/history_entry.hpp>
#include <custody/schema/operation_result.hpp>
#include <cstddef>
#include <string_view>
#include <vector>

namespace custody::ledgers {

/// Group wallet. Anyone may deposit; the owner and the members it admits may
/// withdraw to any recipient, and every movement lands in the history.
class shared_treasury final {
 public:
  shared_treasury(custody::execution::engine& engine, std::string_view pool);

  /// Create the treasury pool. Owner only, once.
  custody::schema::operation_result_t initialize(
      const custody::schema::call_context_t& context);

  custody::schema::operation_result_t add_member(
      const custody::schema::call_context_t& context,
      const custody::schema::principal_id_t& member);
  custody::schema::operation_result_t remove_member(
      const custody::schema::call_context_t& context,
      const custody::schema::principal_id_t& member);
  bool is_member(const custody::schema::principal_id_t& principal) const;

  custody::schema::operation_result_t deposit(
      const custody::schema::call_context_t& context);

  custody::schema::operation_result_t withdraw(
      const custody::schema::call_context_t& context,
      const custody::schema::amount_t& amount,
      const custody::schema::principal_id_t& recipient,
      std::string_view reason);

  std::vector<custody::schema::history_entry_t> recent_history(
      std::size_t n) const;
  custody::schema::amount_t balance() const;

 private:
  custody::execution::engine& engine_;
  custody::schema::record_key_t pool_;
};

}  // namespace custody::ledgers
