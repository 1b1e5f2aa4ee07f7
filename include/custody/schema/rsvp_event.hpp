#pragma once
#include <custody/schema/primitives.hpp>

namespace custody::schema {

template <uint16_t Version>
struct rsvp_event;

template <>
struct rsvp_event<1> final {
  uint16_t version{1};
  record_key_t event;
};

using rsvp_event_t = rsvp_event<1>;

}  // namespace custody::schema
