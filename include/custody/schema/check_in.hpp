#pragma once
#include <custody/schema/primitives.hpp>

// Schema type: check in.
// Custody workflow: Organizer confirms attendance and the attendee's deposit
// is refunded exactly once.
namespace custody::schema {

template <uint16_t Version>
struct check_in;

template <>
struct check_in<1> final {
  uint16_t version{1};
  record_key_t event;
  principal_id_t attendee{};
};

using check_in_t = check_in<1>;

}  // namespace custody::schema
