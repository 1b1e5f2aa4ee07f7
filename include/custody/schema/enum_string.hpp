#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace custody::schema {

/// Fixed name <-> value table for schema enums with a textual form.
template <typename Enum, std::size_t N>
struct enum_names final {
  std::array<std::pair<std::string_view, Enum>, N> entries;

  constexpr std::optional<Enum> parse(const std::string_view name) const {
    for (const auto& [text, value] : entries) {
      if (text == name) {
        return value;
      }
    }
    return std::nullopt;
  }

  constexpr std::string_view name(const Enum value) const {
    for (const auto& [text, entry] : entries) {
      if (entry == value) {
        return text;
      }
    }
    return "unknown";
  }
};

template <typename Enum, typename... Entries>
constexpr auto make_enum_names(Entries... entries) {
  return enum_names<Enum, sizeof...(Entries)>{
      std::array<std::pair<std::string_view, Enum>, sizeof...(Entries)>{
          entries...}};
}

/// Specialized next to each enum that has a textual form.
template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

}  // namespace custody::schema
