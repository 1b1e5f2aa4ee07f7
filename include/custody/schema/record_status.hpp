#pragma once

#include <custody/schema/enum_string.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: record status.
// Custody workflow: active -> {transferred, voided, redeemed, expired,
// cancelled}. `transferred` stays inside the active super-state.
namespace custody::schema {

enum class record_status_t : uint8_t {
  active = 0,
  transferred = 1,
  voided = 2,
  redeemed = 3,
  expired = 4,
  cancelled = 5
};

inline constexpr auto kRecordStatusNames = make_enum_names<record_status_t>(
    std::pair{std::string_view{"active"}, record_status_t::active},
    std::pair{std::string_view{"transferred"}, record_status_t::transferred},
    std::pair{std::string_view{"voided"}, record_status_t::voided},
    std::pair{std::string_view{"redeemed"}, record_status_t::redeemed},
    std::pair{std::string_view{"expired"}, record_status_t::expired},
    std::pair{std::string_view{"cancelled"}, record_status_t::cancelled});

template <>
inline std::optional<record_status_t> try_from_string<record_status_t>(
    const std::string_view value) {
  return kRecordStatusNames.parse(value);
}

inline constexpr std::string_view to_string(const record_status_t value) {
  return kRecordStatusNames.name(value);
}

inline constexpr bool is_live(const record_status_t value) {
  return value == record_status_t::active ||
         value == record_status_t::transferred;
}

}  // namespace custody::schema
