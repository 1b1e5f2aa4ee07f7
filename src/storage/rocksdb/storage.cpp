#include <custody/common/critical.hpp>
#include <custody/storage/rocksdb/storage.hpp>

namespace custody::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open ledger database at {}: {}", path,
                  status.ToString());
    custody::common::critical("Failed to open ledger database");
  }
  spdlog::info("Opened ledger database at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace custody::storage
