#pragma once
#include <covenant/schema/primitives.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace covenant::storage {

using key_value_entry_t =
    std::pair<covenant::schema::bytes_t, covenant::schema::bytes_t>;

/// Puts and deletes applied atomically by storage::commit.
struct write_batch final {
  std::vector<key_value_entry_t> puts;
  std::vector<covenant::schema::bytes_t> deletes;

  void put(covenant::schema::bytes_t key, covenant::schema::bytes_t value) {
    puts.emplace_back(std::move(key), std::move(value));
  }

  void erase(covenant::schema::bytes_t key) {
    deletes.push_back(std::move(key));
  }

  bool empty() const { return puts.empty() && deletes.empty(); }
};

/// Outcome of a write. Backend failures are reported, not fatal; callers
/// decide whether to retry or halt.
struct write_status final {
  bool ok{true};
  std::string error;
};

template <typename Library>
struct storage {
  /// Raw value at key, or std::nullopt when missing.
  std::optional<covenant::schema::bytes_t> get(
      const covenant::schema::bytes_view_t& key) const;

  /// Apply batch atomically. sync forces the write-ahead log to disk before
  /// returning.
  write_status commit(const write_batch& batch, bool sync) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const covenant::schema::bytes_view_t& prefix) const;

  /// Up to limit entries under prefix whose key is >= from, in key order.
  std::vector<key_value_entry_t> list_range(
      const covenant::schema::bytes_view_t& prefix,
      const covenant::schema::bytes_view_t& from,
      std::size_t limit) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace covenant::storage
