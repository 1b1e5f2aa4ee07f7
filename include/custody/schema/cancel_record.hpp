#pragma once
#include <custody/schema/primitives.hpp>
#include <optional>

namespace custody::schema {

template <uint16_t Version>
struct cancel_record;

template <>
struct cancel_record<1> final {
  uint16_t version{1};
  bytes_t secret;
  std::optional<record_key_t> key;
};

using cancel_record_t = cancel_record<1>;

}  // namespace custody::schema
