#pragma once
#include <custody/schema/primitives.hpp>
#include <string>

namespace custody::schema {

template <uint16_t Version>
struct void_record;

template <>
struct void_record<1> final {
  uint16_t version{1};
  record_key_t key;
  std::string reason;
};

using void_record_t = void_record<1>;

}  // namespace custody::schema
