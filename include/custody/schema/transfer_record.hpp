#pragma once
#include <custody/schema/primitives.hpp>

namespace custody::schema {

template <uint16_t Version>
struct transfer_record;

template <>
struct transfer_record<1> final {
  uint16_t version{1};
  record_key_t key;
  principal_id_t new_beneficiary{};
};

using transfer_record_t = transfer_record<1>;

}  // namespace custody::schema
