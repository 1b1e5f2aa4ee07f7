#pragma once
#include <custody/schema/primitives.hpp>

namespace custody::schema {

template <uint16_t Version>
struct purchase_item;

template <>
struct purchase_item<1> final {
  uint16_t version{1};
  record_key_t key;
};

using purchase_item_t = purchase_item<1>;

}  // namespace custody::schema
