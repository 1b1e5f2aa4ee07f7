#pragma once

#include <custody/schema/primitives.hpp>

namespace custody::execution {

/// Record key committing to `secret`: blake3(secret).
custody::schema::record_key_t make_commitment(
    const custody::schema::bytes_view_t& secret);

/// Exact-match comparison that inspects every byte of equal-length inputs.
bool commitments_equal(const custody::schema::bytes_view_t& lhs,
                       const custody::schema::bytes_view_t& rhs);

}  // namespace custody::execution
