#pragma once

#include <custody/schema/enum_string.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace custody::schema {

enum class error_code_t : uint32_t {
  ok = 0,
  unauthorized = 1,
  already_exists = 2,
  not_found = 3,
  invalid_input = 4,
  invalid_state = 5,
  expired = 6,
  capacity_exceeded = 7,
  transfer_failed = 8,
};

inline constexpr auto kErrorCodeNames = make_enum_names<error_code_t>(
    std::pair{std::string_view{"ok"}, error_code_t::ok},
    std::pair{std::string_view{"unauthorized"}, error_code_t::unauthorized},
    std::pair{std::string_view{"already_exists"},
              error_code_t::already_exists},
    std::pair{std::string_view{"not_found"}, error_code_t::not_found},
    std::pair{std::string_view{"invalid_input"}, error_code_t::invalid_input},
    std::pair{std::string_view{"invalid_state"}, error_code_t::invalid_state},
    std::pair{std::string_view{"expired"}, error_code_t::expired},
    std::pair{std::string_view{"capacity_exceeded"},
              error_code_t::capacity_exceeded},
    std::pair{std::string_view{"transfer_failed"},
              error_code_t::transfer_failed});

template <>
inline std::optional<error_code_t> try_from_string<error_code_t>(
    const std::string_view value) {
  return kErrorCodeNames.parse(value);
}

inline constexpr std::string_view to_string(const error_code_t value) {
  return kErrorCodeNames.name(value);
}

}  // namespace custody::schema
