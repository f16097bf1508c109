#include <segurolluvia/common/critical.hpp>
#include <segurolluvia/storage/rocksdb/storage.hpp>
#include <fmt/format.h>

namespace segurolluvia::storage {
template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path,
    bool read_only) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = !read_only;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      read_only ? ROCKSDB_NAMESPACE::DB::OpenForReadOnly(
                      options, std::string{path}, &database)
                : ROCKSDB_NAMESPACE::DB::Open(options, std::string{path},
                                              &database);
  if (!status.ok()) {
    segurolluvia::common::critical(
        fmt::format("Failed to open RocksDB at {}", path), status.ToString());
  }
  spdlog::info("Successfully opened RocksDB at {}{}", path,
               read_only ? " (read-only)" : "");
  store.database.reset(database);
  store.read_only = read_only;

  return store;
}
}  // namespace segurolluvia::storage
