#pragma once

#include <custody/schema/enum_string.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: event kind.
// Custody workflow: One kind per committed transition; shared by the history
// log and the observer-facing event stream.
namespace custody::schema {

enum class event_kind_t : uint8_t {
  created = 0,
  transferred = 1,
  voided = 2,
  redeemed = 3,
  cancelled = 4,
  membership_changed = 5,
  funds_withdrawn = 6,
  funds_deposited = 7,
  ownership_transferred = 8,
  purchased = 9,
  admitted = 10,
  checked_in = 11,
  forfeited = 12
};

inline constexpr auto kEventKindNames = make_enum_names<event_kind_t>(
    std::pair{std::string_view{"created"}, event_kind_t::created},
    std::pair{std::string_view{"transferred"}, event_kind_t::transferred},
    std::pair{std::string_view{"voided"}, event_kind_t::voided},
    std::pair{std::string_view{"redeemed"}, event_kind_t::redeemed},
    std::pair{std::string_view{"cancelled"}, event_kind_t::cancelled},
    std::pair{std::string_view{"membership_changed"},
              event_kind_t::membership_changed},
    std::pair{std::string_view{"funds_withdrawn"},
              event_kind_t::funds_withdrawn},
    std::pair{std::string_view{"funds_deposited"},
              event_kind_t::funds_deposited},
    std::pair{std::string_view{"ownership_transferred"},
              event_kind_t::ownership_transferred},
    std::pair{std::string_view{"purchased"}, event_kind_t::purchased},
    std::pair{std::string_view{"admitted"}, event_kind_t::admitted},
    std::pair{std::string_view{"checked_in"}, event_kind_t::checked_in},
    std::pair{std::string_view{"forfeited"}, event_kind_t::forfeited});

template <>
inline std::optional<event_kind_t> try_from_string<event_kind_t>(
    const std::string_view value) {
  return kEventKindNames.parse(value);
}

inline constexpr std::string_view to_string(const event_kind_t value) {
  return kEventKindNames.name(value);
}

}  // namespace custody::schema
