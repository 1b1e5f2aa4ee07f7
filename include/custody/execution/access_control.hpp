#pragma once

#include <custody/execution/ledger_store.hpp>
#include <custody/schema/error_code.hpp>
#include <custody/schema/primitives.hpp>

namespace custody::execution {

/// Single-owner plus owner-managed member group for one ledger.
///
/// Checks return `error_code_t::ok` or `unauthorized`; mutations return the
/// code of the first failed precondition and touch nothing on failure.
class access_control final {
 public:
  explicit access_control(ledger_store& store);

  /// Establish the owner when the ledger has none yet. Returns false when an
  /// owner is already persisted.
  bool initialize(const custody::schema::principal_id_t& owner);

  custody::schema::principal_id_t owner() const;
  bool is_owner(const custody::schema::principal_id_t& principal) const;
  bool is_member(const custody::schema::principal_id_t& principal) const;
  /// Owner or member.
  bool has_group_privilege(
      const custody::schema::principal_id_t& principal) const;

  custody::schema::error_code_t require_owner(
      const custody::schema::principal_id_t& caller) const;
  custody::schema::error_code_t require_group(
      const custody::schema::principal_id_t& caller) const;

  custody::schema::error_code_t transfer_ownership(
      const custody::schema::principal_id_t& caller,
      const custody::schema::principal_id_t& new_owner);
  custody::schema::error_code_t add_member(
      const custody::schema::principal_id_t& caller,
      const custody::schema::principal_id_t& member);
  custody::schema::error_code_t remove_member(
      const custody::schema::principal_id_t& caller,
      const custody::schema::principal_id_t& member);

 private:
  ledger_store& store_;
};

}  // namespace custody::execution
