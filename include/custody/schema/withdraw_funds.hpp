#pragma once
#include <custody/schema/primitives.hpp>
#include <string>

namespace custody::schema {

template <uint16_t Version>
struct withdraw_funds;

template <>
struct withdraw_funds<1> final {
  uint16_t version{1};
  record_key_t pool;
  amount_t amount{};
  principal_id_t recipient{};
  std::string reason;
};

using withdraw_funds_t = withdraw_funds<1>;

}  // namespace custody::schema
