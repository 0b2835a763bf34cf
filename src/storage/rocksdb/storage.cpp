#include <spdlog/spdlog.h>
#include <covenant/common/critical.hpp>
#include <covenant/storage/rocksdb/storage.hpp>
#include <string>
#include <utility>

namespace covenant::storage {

namespace {

ROCKSDB_NAMESPACE::Slice to_slice(const covenant::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

covenant::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

bool starts_with(const ROCKSDB_NAMESPACE::Slice& key,
                 const covenant::schema::bytes_view_t& prefix) {
  return key.starts_with(to_slice(prefix));
}

void require_database(const std::unique_ptr<ROCKSDB_NAMESPACE::DB>& database) {
  if (!database) {
    covenant::common::critical("RocksDB database is not initialized");
  }
}

}  // namespace

std::optional<rocksdb_storage_t> try_make_storage(const std::string_view& path,
                                                  std::string& error) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    error = status.ToString();
    spdlog::error("Failed to open RocksDB at {}: {}", path, error);
    return std::nullopt;
  }
  spdlog::info("Opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto error = std::string{};
  auto store = try_make_storage(path, error);
  if (!store) {
    covenant::common::critical("Failed to open RocksDB");
  }
  return std::move(*store);
}

std::optional<covenant::schema::bytes_t> storage<rocksdb_storage_tag>::get(
    const covenant::schema::bytes_view_t& key) const {
  require_database(database);
  auto value = std::string{};
  auto status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{}, to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    covenant::common::critical("Failed to get value from RocksDB");
  }
  return covenant::schema::make_bytes(value);
}

write_status storage<rocksdb_storage_tag>::commit(const write_batch& batch,
                                                  const bool sync) const {
  require_database(database);
  auto rocks_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& key : batch.deletes) {
    auto status = rocks_batch.Delete(to_slice(key));
    if (!status.ok()) {
      return write_status{.ok = false, .error = status.ToString()};
    }
  }
  for (const auto& [key, value] : batch.puts) {
    auto status = rocks_batch.Put(to_slice(key), to_slice(value));
    if (!status.ok()) {
      return write_status{.ok = false, .error = status.ToString()};
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = sync;
  auto status = database->Write(write_options, &rocks_batch);
  if (!status.ok()) {
    spdlog::warn("RocksDB batch write failed: {}", status.ToString());
    return write_status{.ok = false, .error = status.ToString()};
  }
  return write_status{};
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const covenant::schema::bytes_view_t& prefix) const {
  require_database(database);

  auto entries = std::vector<key_value_entry_t>{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(to_slice(prefix));
       iterator->Valid() && starts_with(iterator->key(), prefix);
       iterator->Next()) {
    entries.push_back(key_value_entry_t{to_bytes(iterator->key()),
                                        to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB prefix scan failed: {}",
                  iterator->status().ToString());
    covenant::common::critical("RocksDB prefix scan failed");
  }
  return entries;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_range(
    const covenant::schema::bytes_view_t& prefix,
    const covenant::schema::bytes_view_t& from,
    const std::size_t limit) const {
  require_database(database);

  auto entries = std::vector<key_value_entry_t>{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(to_slice(from));
       iterator->Valid() && starts_with(iterator->key(), prefix) &&
       entries.size() < limit;
       iterator->Next()) {
    entries.push_back(key_value_entry_t{to_bytes(iterator->key()),
                                        to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB range scan failed: {}",
                  iterator->status().ToString());
    covenant::common::critical("RocksDB range scan failed");
  }
  return entries;
}

}  // namespace covenant::storage
