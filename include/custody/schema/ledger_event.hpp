#pragma once

#include <custody/schema/event_kind.hpp>
#include <custody/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: ledger event.
// Custody workflow: Observer-facing notification, emitted exactly once per
// committed transition and never for an aborted one.
namespace custody::schema {

template <uint16_t Version>
struct ledger_event;

template <>
struct ledger_event<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  event_kind_t kind{};
  record_key_t key;
  std::vector<principal_id_t> principals;
  amount_t amount{};
  std::string reason;
  timestamp_milliseconds_t timestamp{};
};

using ledger_event_t = ledger_event<1>;

}  // namespace custody::schema
