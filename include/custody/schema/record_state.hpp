#pragma once

#include <custody/schema/access_policy.hpp>
#include <custody/schema/primitives.hpp>
#include <custody/schema/record_kind.hpp>
#include <custody/schema/record_status.hpp>
#include <cstdint>
#include <optional>

// Schema type: record state.
// Custody workflow: The unit of custody. One shape for every record kind;
// fields a kind does not use stay at their defaults.
namespace custody::schema {

template <uint16_t Version>
struct record_state;

template <>
struct record_state<1> final {
  uint16_t version{1};
  record_kind_t kind{};
  record_key_t key;
  record_status_t status{record_status_t::active};
  // Current principal entitled to act on, or be paid from, the record.
  principal_id_t owner{};
  // Principal that created the record (and funded it, for deposits).
  principal_id_t depositor{};
  amount_t value{};
  // Price of a registry item, deposit of an event.
  amount_t unit_value{};
  timestamp_milliseconds_t created_at{};
  std::optional<timestamp_milliseconds_t> expires_at;
  uint32_t capacity{};
  uint32_t admitted{};
  bool has_checked_in{};
  access_policy_t access{access_policy_t::owner_only};
  std::optional<record_key_t> parent;
  bytes_t payload;
};

using record_state_t = record_state<1>;

}  // namespace custody::schema
