#pragma once

#include <custody/schema/primitives.hpp>

// Schema type: call context.
// Custody workflow: Identity of the calling principal plus the value the host
// attached to the call. Supplied by the host for every operation.
namespace custody::schema {

struct call_context_t final {
  principal_id_t caller{};
  amount_t attached_value{};
};

}  // namespace custody::schema
