#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <spdlog/spdlog.h>
#include <segurolluvia/common/critical.hpp>
#include <segurolluvia/storage/storage.hpp>
#include <algorithm>
#include <memory>
#include <string_view>

namespace segurolluvia::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const segurolluvia::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const segurolluvia::schema::address_t& address) {
  return ROCKSDB_NAMESPACE::Slice{
      reinterpret_cast<const char*>(address.data()), address.size()};
}

inline segurolluvia::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;
  bool read_only{false};

  std::optional<segurolluvia::schema::bytes_t> get(
      const segurolluvia::schema::address_t& address) const;
  std::vector<segurolluvia::schema::address_t> set(
      const segurolluvia::schema::address_t& address,
      const segurolluvia::schema::bytes_view_t& value) const;
  std::vector<state_entry_t> list_by_prefix(
      const segurolluvia::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path,
    bool read_only);

inline std::optional<segurolluvia::schema::bytes_t>
storage<rocksdb_storage_tag>::get(
    const segurolluvia::schema::address_t& address) const {
  if (!database) {
    segurolluvia::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(address), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    segurolluvia::common::critical("Failed to get value from RocksDB",
                                   status.ToString());
  }
  return segurolluvia::schema::make_bytes(std::string_view{value});
}

inline std::vector<segurolluvia::schema::address_t>
storage<rocksdb_storage_tag>::set(
    const segurolluvia::schema::address_t& address,
    const segurolluvia::schema::bytes_view_t& value) const {
  if (!database) {
    segurolluvia::common::critical("RocksDB database is not initialized");
  }
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              detail::to_slice(address),
                              detail::to_slice(value));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    return {};
  }
  return {address};
}

inline std::vector<state_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const segurolluvia::schema::bytes_view_t& prefix) const {
  if (!database) {
    segurolluvia::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<state_entry_t>{};
  auto prefix_slice = detail::to_slice(prefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix_slice);
       iterator->Valid() && iterator->key().starts_with(prefix_slice);
       iterator->Next()) {
    auto key = iterator->key();
    if (key.size() != std::tuple_size_v<segurolluvia::schema::address_t>) {
      spdlog::warn("Skipping key of unexpected size {} under namespace",
                   key.size());
      continue;
    }
    auto address = segurolluvia::schema::address_t{};
    std::copy_n(reinterpret_cast<const uint8_t*>(key.data()), address.size(),
                std::begin(address));
    entries.push_back(state_entry_t{address, detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    segurolluvia::common::critical("RocksDB iteration failed",
                                   iterator->status().ToString());
  }
  return entries;
}

}  // namespace segurolluvia::storage
