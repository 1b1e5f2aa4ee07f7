#pragma once
#include <custody/schema/primitives.hpp>
#include <string_view>

namespace custody::blake3 {

custody::schema::hash32_t hash(const std::string_view& str);
custody::schema::hash32_t hash(const custody::schema::bytes_view_t& bytes);

}  // namespace custody::blake3
