#include <gtest/gtest.h>
#include <covenant/storage/rocksdb/storage.hpp>
#include <covenant/testing/common.hpp>

#include <fstream>
#include <string>

using namespace covenant::schema;
using covenant::storage::write_batch;

namespace {

bytes_t text(const std::string_view value) {
  return make_bytes(value);
}

}  // namespace

TEST(storage, commit_applies_puts_and_deletes_together) {
  auto db = covenant::testing::temp_database{"covenant_storage_commit"};
  auto& storage = db.storage();

  auto first = write_batch{};
  first.put(text("K|a"), text("1"));
  first.put(text("K|b"), text("2"));
  ASSERT_TRUE(storage.commit(first, true).ok);

  auto second = write_batch{};
  second.erase(text("K|a"));
  second.put(text("K|c"), text("3"));
  ASSERT_TRUE(storage.commit(second, false).ok);

  EXPECT_FALSE(storage.get(text("K|a")).has_value());
  EXPECT_EQ(storage.get(text("K|b")), std::optional<bytes_t>{text("2")});
  EXPECT_EQ(storage.get(text("K|c")), std::optional<bytes_t>{text("3")});
}

TEST(storage, list_by_prefix_stays_inside_the_prefix) {
  auto db = covenant::testing::temp_database{"covenant_storage_prefix"};
  auto batch = write_batch{};
  batch.put(text("A|1"), text("x"));
  batch.put(text("A|2"), text("y"));
  batch.put(text("B|1"), text("z"));
  ASSERT_TRUE(db.storage().commit(batch, false).ok);

  auto rows = db.storage().list_by_prefix(text("A|"));
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].first, text("A|1"));
  EXPECT_EQ(rows[1].first, text("A|2"));
}

TEST(storage, list_range_pages_from_a_start_key) {
  auto db = covenant::testing::temp_database{"covenant_storage_range"};
  auto batch = write_batch{};
  for (auto c : std::string{"abcdef"}) {
    batch.put(text(std::string{"R|"} + c), text(std::string{c}));
  }
  batch.put(text("S|a"), text("outside"));
  ASSERT_TRUE(db.storage().commit(batch, false).ok);

  auto page = db.storage().list_range(text("R|"), text("R|c"), 2);
  ASSERT_EQ(page.size(), 2u);
  EXPECT_EQ(page[0].first, text("R|c"));
  EXPECT_EQ(page[1].first, text("R|d"));

  auto tail = db.storage().list_range(text("R|"), text("R|f"), 10);
  ASSERT_EQ(tail.size(), 1u);
  EXPECT_EQ(tail[0].first, text("R|f"));
}

TEST(storage, rows_survive_reopen) {
  auto db = covenant::testing::temp_database{"covenant_storage_reopen"};
  auto batch = write_batch{};
  batch.put(text("K|durable"), text("yes"));
  ASSERT_TRUE(db.storage().commit(batch, true).ok);

  db.reopen();
  EXPECT_EQ(db.storage().get(text("K|durable")),
            std::optional<bytes_t>{text("yes")});
}

TEST(storage, try_make_storage_reports_unopenable_paths) {
  auto path = covenant::testing::make_db_path("covenant_storage_file");
  {
    auto file = std::ofstream{path};
    file << "not a database directory";
  }
  auto error = std::string{};
  auto store = covenant::storage::try_make_storage(path, error);
  EXPECT_FALSE(store.has_value());
  EXPECT_FALSE(error.empty());
  covenant::testing::remove_path(path);
}
