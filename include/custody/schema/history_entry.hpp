#pragma once

#include <custody/schema/event_kind.hpp>
#include <custody/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: history entry.
// Custody workflow: Audit history row, appended once per committed
// transition and never edited.
namespace custody::schema {

template <uint16_t Version>
struct history_entry;

template <>
struct history_entry<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  event_kind_t kind{};
  record_key_t key;
  principal_id_t actor{};
  principal_id_t counterparty{};
  amount_t amount{};
  std::string reason;
  timestamp_milliseconds_t timestamp{};
};

using history_entry_t = history_entry<1>;

}  // namespace custody::schema
