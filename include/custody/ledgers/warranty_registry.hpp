#pragma once

#include <custody/execution/engine.hpp>
#include <custody/schema/history_entry.hpp>
#include <custody/schema/operation_result.hpp>
#include <custody/schema/record_view.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace custody::ledgers {

/// Product warranties keyed by serial number. The ledger owner issues and
/// voids; the customer holding a warranty may hand it to someone else until
/// it expires.
class warranty_registry final {
 public:
  static constexpr uint64_t kMillisecondsPerDay{86'400'000};

  explicit warranty_registry(custody::execution::engine& engine);

  custody::schema::operation_result_t issue(
      const custody::schema::call_context_t& context,
      std::string_view serial,
      const custody::schema::principal_id_t& customer,
      uint64_t days,
      std::string_view details);

  custody::schema::operation_result_t transfer(
      const custody::schema::call_context_t& context,
      std::string_view serial,
      const custody::schema::principal_id_t& new_owner);

  custody::schema::operation_result_t void_warranty(
      const custody::schema::call_context_t& context,
      std::string_view serial,
      std::string_view reason);

  std::optional<custody::schema::record_view_t> inspect(
      std::string_view serial) const;

  std::vector<custody::schema::history_entry_t> history(std::size_t n) const;

 private:
  custody::execution::engine& engine_;
};

}  // namespace custody::ledgers
