#pragma once

#include <custody/schema/call_context.hpp>
#include <custody/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace custody::testing {

inline constexpr custody::schema::timestamp_milliseconds_t kStartTime{
    1'700'000'000'000};

inline custody::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = custody::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Distinct, non-null principal per seed.
inline custody::schema::principal_id_t make_principal(const uint8_t seed) {
  auto principal = custody::schema::principal_id_t{};
  principal[0] = 0xA0;
  principal[1] = seed;
  return principal;
}

inline custody::schema::call_context_t as(
    const custody::schema::principal_id_t& caller,
    const custody::schema::amount_t& attached_value = 0) {
  return custody::schema::call_context_t{.caller = caller,
                                         .attached_value = attached_value};
}

inline std::string make_db_path(const std::string_view prefix) {
  auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  auto path = std::filesystem::temp_directory_path() /
              (std::string{prefix} + "_" +
               std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace custody::testing
