#include <spdlog/spdlog.h>
#include <custody/execution/access_control.hpp>

using namespace custody::schema;

namespace custody::execution {

access_control::access_control(ledger_store& store) : store_{store} {}

bool access_control::initialize(const principal_id_t& owner) {
  if (store_.owner().has_value()) {
    return false;
  }
  store_.set_owner(owner);
  spdlog::info("Ledger {} owned by {}", to_hex(store_.ledger_id()),
               to_hex(owner));
  return true;
}

principal_id_t access_control::owner() const {
  return store_.owner().value_or(make_zero_hash());
}

bool access_control::is_owner(const principal_id_t& principal) const {
  return !is_null(principal) && owner() == principal;
}

bool access_control::is_member(const principal_id_t& principal) const {
  return store_.is_member(principal);
}

bool access_control::has_group_privilege(
    const principal_id_t& principal) const {
  return is_owner(principal) || is_member(principal);
}

error_code_t access_control::require_owner(const principal_id_t& caller) const {
  return is_owner(caller) ? error_code_t::ok : error_code_t::unauthorized;
}

error_code_t access_control::require_group(const principal_id_t& caller) const {
  return has_group_privilege(caller) ? error_code_t::ok
                                     : error_code_t::unauthorized;
}

error_code_t access_control::transfer_ownership(
    const principal_id_t& caller,
    const principal_id_t& new_owner) {
  if (auto code = require_owner(caller); code != error_code_t::ok) {
    return code;
  }
  if (is_null(new_owner)) {
    return error_code_t::invalid_input;
  }
  store_.set_owner(new_owner);
  return error_code_t::ok;
}

error_code_t access_control::add_member(const principal_id_t& caller,
                                        const principal_id_t& member) {
  if (auto code = require_owner(caller); code != error_code_t::ok) {
    return code;
  }
  if (is_null(member)) {
    return error_code_t::invalid_input;
  }
  if (store_.is_member(member)) {
    return error_code_t::already_exists;
  }
  store_.set_member(member, true);
  return error_code_t::ok;
}

error_code_t access_control::remove_member(const principal_id_t& caller,
                                           const principal_id_t& member) {
  if (auto code = require_owner(caller); code != error_code_t::ok) {
    return code;
  }
  if (is_null(member)) {
    return error_code_t::invalid_input;
  }
  if (!store_.is_member(member)) {
    return error_code_t::not_found;
  }
  store_.set_member(member, false);
  return error_code_t::ok;
}

}  // namespace custody::execution
