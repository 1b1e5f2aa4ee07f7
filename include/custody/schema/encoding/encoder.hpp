#pragma once
#include <custody/schema/primitives.hpp>

namespace custody::schema::encoding {

/// Binary codec for persisted ledger state, selected at build time by tag.
template <typename Library>
struct encoder {
  template <typename T>
  custody::schema::bytes_t encode(const T& obj);

  /// Append the encoding of `obj` to `out`.
  template <typename T>
  void encode(const T& obj, custody::schema::bytes_t& out);

  template <typename T>
  T decode(const custody::schema::bytes_view_t& bytes);
};

}  // namespace custody::schema::encoding
