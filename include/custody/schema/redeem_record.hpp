#pragma once
#include <custody/schema/primitives.hpp>
#include <optional>
#include <string>

namespace custody::schema {

template <uint16_t Version>
struct redeem_record;

template <>
struct redeem_record<1> final {
  uint16_t version{1};
  bytes_t secret;
  std::optional<record_key_t> key;
  std::string message;
};

using redeem_record_t = redeem_record<1>;

}  // namespace custody::schema
