#pragma once
#include <custody/schema/primitives.hpp>

namespace custody::schema {

template <uint16_t Version>
struct close_event;

template <>
struct close_event<1> final {
  uint16_t version{1};
  record_key_t event;
};

using close_event_t = close_event<1>;

}  // namespace custody::schema
