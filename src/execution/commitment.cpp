#include <custody/blake3/hash.hpp>
#include <custody/execution/commitment.hpp>

namespace custody::execution {

custody::schema::record_key_t make_commitment(
    const custody::schema::bytes_view_t& secret) {
  return custody::schema::make_bytes(custody::blake3::hash(secret));
}

bool commitments_equal(const custody::schema::bytes_view_t& lhs,
                       const custody::schema::bytes_view_t& rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  auto difference = uint8_t{0};
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    difference = static_cast<uint8_t>(difference | (lhs[i] ^ rhs[i]));
  }
  return difference == 0;
}

}  // namespace custody::execution
