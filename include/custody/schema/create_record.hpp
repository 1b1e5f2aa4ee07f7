#pragma once
#include <custody/schema/access_policy.hpp>
#include <custody/schema/primitives.hpp>
#include <custody/schema/record_kind.hpp>
#include <optional>

// Schema type: create record.
// Custody workflow: Nonexistent -> active. `duration` of zero means the
// record never expires; `unit_value` is a price or a per-attendee deposit.
namespace custody::schema {

template <uint16_t Version>
struct create_record;

template <>
struct create_record<1> final {
  uint16_t version{1};
  record_kind_t kind{};
  record_key_t key;
  principal_id_t beneficiary{};
  duration_milliseconds_t duration{};
  amount_t unit_value{};
  uint32_t capacity{};
  access_policy_t access{access_policy_t::owner_only};
  std::optional<record_key_t> parent;
  bytes_t payload;
};

using create_record_t = create_record<1>;

}  // namespace custody::schema
