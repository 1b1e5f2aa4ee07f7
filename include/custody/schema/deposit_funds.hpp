#pragma once
#include <custody/schema/primitives.hpp>

namespace custody::schema {

template <uint16_t Version>
struct deposit_funds;

template <>
struct deposit_funds<1> final {
  uint16_t version{1};
  record_key_t pool;
};

using deposit_funds_t = deposit_funds<1>;

}  // namespace custody::schema
