#pragma once

#include <covenant/common/clock.hpp>
#include <covenant/schema/primitives.hpp>
#include <covenant/storage/rocksdb/storage.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace covenant::testing {

inline covenant::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = covenant::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline covenant::schema::ed25519_signer_id make_ed25519_signer(
    const uint8_t seed) {
  auto signer = covenant::schema::ed25519_signer_id{};
  for (std::size_t i = 0; i < signer.public_key.size(); ++i) {
    signer.public_key[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return signer;
}

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(counter.fetch_add(1)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Clock that only moves when told to.
class manual_clock final {
 public:
  explicit manual_clock(const covenant::schema::timestamp_milliseconds_t start =
                            1'700'000'000'000)
      : now_{std::make_shared<std::atomic<uint64_t>>(start)} {}

  covenant::schema::timestamp_milliseconds_t now() const { return now_->load(); }

  void advance(const covenant::schema::duration_milliseconds_t by) {
    now_->fetch_add(by);
  }

  /// Shares state with this object; stays valid after the object is copied.
  covenant::common::clock_t function() const {
    return [now = now_]() { return now->load(); };
  }

 private:
  std::shared_ptr<std::atomic<uint64_t>> now_;
};

/// RocksDB directory removed on destruction. The database can be closed and
/// reopened to simulate a restart.
class temp_database final {
 public:
  explicit temp_database(const std::string_view prefix)
      : path_{make_db_path(prefix)} {
    reopen();
  }

  temp_database(const temp_database&) = delete;
  temp_database& operator=(const temp_database&) = delete;

  ~temp_database() {
    storage_.reset();
    remove_path(path_);
  }

  const std::string& path() const { return path_; }

  covenant::storage::rocksdb_storage_t& storage() { return *storage_; }

  void close() { storage_.reset(); }

  void reopen() {
    storage_.reset();
    storage_ = std::make_unique<covenant::storage::rocksdb_storage_t>(
        covenant::storage::make_storage<covenant::storage::rocksdb_storage_tag>(
            path_));
  }

  /// Second handle on the same database, opened read-only. Reads see the
  /// data committed so far; every commit through it fails.
  std::unique_ptr<covenant::storage::rocksdb_storage_t> open_read_only() const {
    ROCKSDB_NAMESPACE::DB* database{nullptr};
    auto status = ROCKSDB_NAMESPACE::DB::OpenForReadOnly(
        ROCKSDB_NAMESPACE::Options{}, path_, &database);
    if (!status.ok()) {
      return nullptr;
    }
    auto store = std::make_unique<covenant::storage::rocksdb_storage_t>();
    store->database.reset(database);
    return store;
  }

 private:
  std::string path_;
  std::unique_ptr<covenant::storage::rocksdb_storage_t> storage_;
};

}  // namespace covenant::testing
