#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <covenant/storage/storage.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace covenant::storage {

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<covenant::schema::bytes_t> get(
      const covenant::schema::bytes_view_t& key) const;
  write_status commit(const write_batch& batch, bool sync) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const covenant::schema::bytes_view_t& prefix) const;
  std::vector<key_value_entry_t> list_range(
      const covenant::schema::bytes_view_t& prefix,
      const covenant::schema::bytes_view_t& from,
      std::size_t limit) const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

/// As make_storage, but reports an unopenable database through error
/// instead of terminating.
std::optional<rocksdb_storage_t> try_make_storage(const std::string_view& path,
                                                  std::string& error);

}  // namespace covenant::storage
