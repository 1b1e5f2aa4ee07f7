#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <custody/common/critical.hpp>
#include <custody/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace custody::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const custody::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline custody::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const custody::schema::bytes_view_t& key) const;

  std::optional<custody::schema::bytes_t> get_bytes(
      const custody::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const custody::schema::bytes_view_t& key,
           const T& value);

  void write(const std::vector<key_value_entry_t>& entries) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const custody::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const custody::schema::bytes_view_t& key) const {
  auto value = get_bytes(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      custody::schema::bytes_view_t{value->data(), value->size()})};
}

inline std::optional<custody::schema::bytes_t>
storage<rocksdb_storage_tag>::get_bytes(
    const custody::schema::bytes_view_t& key) const {
  if (!database) {
    custody::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    custody::common::critical("Failed to get value from RocksDB");
  }
  return custody::schema::bytes_t{std::begin(value), std::end(value)};
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const custody::schema::bytes_view_t& key,
                                       const T& value) {
  if (!database) {
    custody::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(custody::schema::bytes_view_t{encoded_value.data(),
                                                     encoded_value.size()}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    custody::common::critical("Failed to put value into RocksDB");
  }
}

inline void storage<rocksdb_storage_tag>::write(
    const std::vector<key_value_entry_t>& entries) const {
  if (!database) {
    custody::common::critical("RocksDB database is not initialized");
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status =
        batch.Put(detail::to_slice(custody::schema::bytes_view_t{key}),
                  detail::to_slice(custody::schema::bytes_view_t{value}));
    if (!put_status.ok()) {
      custody::common::critical("failed staging key in write batch");
    }
  }
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch: {}", write_status.ToString());
    custody::common::critical("failed to commit write batch");
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const custody::schema::bytes_view_t& prefix) const {
  if (!database) {
    custody::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  return entries;
}

}  // namespace custody::storage
