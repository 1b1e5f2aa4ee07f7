#pragma once
#include <custody/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace custody::storage {

using key_value_entry_t =
    std::pair<custody::schema::bytes_t, custody::schema::bytes_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const custody::schema::bytes_view_t& key) const;

  /// Return the raw bytes at key, or std::nullopt when missing.
  std::optional<custody::schema::bytes_t> get_bytes(
      const custody::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const custody::schema::bytes_view_t& key,
           const T& value);

  /// Persist all entries in one atomic write.
  void write(const std::vector<key_value_entry_t>& entries) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const custody::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace custody::storage
