#pragma once

#include <custody/schema/primitives.hpp>
#include <custody/schema/record_kind.hpp>
#include <custody/schema/record_status.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: record view.
// Custody workflow: Read-only projection returned by inspect and list.
// `status` is the effective status, so a live record past its expiry reads
// as expired even though no transition has been written.
namespace custody::schema {

template <uint16_t Version>
struct record_view;

template <>
struct record_view<1> final {
  uint16_t version{1};
  record_key_t key;
  record_kind_t kind{};
  bool valid{};
  record_status_t status{};
  std::string status_text;
  principal_id_t beneficiary{};
  principal_id_t depositor{};
  amount_t value{};
  amount_t unit_value{};
  std::optional<timestamp_milliseconds_t> expires_at;
  uint32_t capacity{};
  uint32_t admitted{};
  bool has_checked_in{};
  bytes_t payload;
};

using record_view_t = record_view<1>;

}  // namespace custody::schema
