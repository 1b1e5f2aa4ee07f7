#pragma once

#include <custody/schema/enum_string.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: record kind.
// Custody workflow: Selects the lifecycle rules a record follows (who may
// create it, whether it holds value, which transitions it accepts).
namespace custody::schema {

enum class record_kind_t : uint8_t {
  warranty = 0,
  registry_item = 1,
  gift_card = 2,
  pool = 3,
  event = 4,
  attendee = 5
};

inline constexpr auto kRecordKindNames = make_enum_names<record_kind_t>(
    std::pair{std::string_view{"warranty"}, record_kind_t::warranty},
    std::pair{std::string_view{"registry_item"}, record_kind_t::registry_item},
    std::pair{std::string_view{"gift_card"}, record_kind_t::gift_card},
    std::pair{std::string_view{"pool"}, record_kind_t::pool},
    std::pair{std::string_view{"event"}, record_kind_t::event},
    std::pair{std::string_view{"attendee"}, record_kind_t::attendee});

template <>
inline std::optional<record_kind_t> try_from_string<record_kind_t>(
    const std::string_view value) {
  return kRecordKindNames.parse(value);
}

inline constexpr std::string_view to_string(const record_kind_t value) {
  return kRecordKindNames.name(value);
}

}  // namespace custody::schema
