#pragma once

#include <custody/schema/enum_string.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: access policy.
// Custody workflow: Who may release value held by a pool record: the sole
// owner, or any member of the owner-managed group.
namespace custody::schema {

enum class access_policy_t : uint8_t { owner_only = 0, members = 1 };

inline constexpr auto kAccessPolicyNames = make_enum_names<access_policy_t>(
    std::pair{std::string_view{"owner_only"}, access_policy_t::owner_only},
    std::pair{std::string_view{"members"}, access_policy_t::members});

template <>
inline std::optional<access_policy_t> try_from_string<access_policy_t>(
    const std::string_view value) {
  return kAccessPolicyNames.parse(value);
}

inline constexpr std::string_view to_string(const access_policy_t value) {
  return kAccessPolicyNames.name(value);
}

}  // namespace custody::schema
