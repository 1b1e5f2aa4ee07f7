#pragma once

#include <custody/schema/error_code.hpp>
#include <custody/schema/ledger_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace custody::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  error_code_t code{error_code_t::ok};
  std::string log;
  std::string codespace;
  std::vector<ledger_event_t> events;
};

using operation_result_t = operation_result<1>;

}  // namespace custody::schema
