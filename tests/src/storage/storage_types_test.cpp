#include <glyphvault/common/error.hpp>
#include <glyphvault/schema/encoding/scale/encoder.hpp>
#include <glyphvault/storage/rocksdb/storage.hpp>
#include <glyphvault/storage/storage.hpp>
#include <glyphvault/testing/common.hpp>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace {

using storage_t =
    glyphvault::storage::storage<glyphvault::storage::rocksdb_storage_tag>;
using encoder_t = glyphvault::schema::encoding::encoder<
    glyphvault::schema::encoding::scale_encoder_tag>;

glyphvault::schema::bytes_view_t view(const std::string_view text) {
  return glyphvault::schema::make_bytes_view(text);
}

}  // namespace

TEST(storage_types, defaults_are_stable) {
  auto entry = glyphvault::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());

  auto batch = glyphvault::storage::write_batch{};
  EXPECT_TRUE(batch.empty());
}

TEST(storage_types, committed_batch_is_readable) {
  auto db = glyphvault::testing::scoped_path{"glyphvault_storage_batch"};
  auto storage = glyphvault::storage::make_storage<
      glyphvault::storage::rocksdb_storage_tag>(db.str());

  auto encoder = encoder_t{};
  auto batch = glyphvault::storage::write_batch{};
  batch.put(view("alpha"), view("1"));
  batch.put(encoder, view("counter"), uint64_t{42});
  EXPECT_FALSE(batch.empty());
  storage.commit(batch);

  auto raw = storage.get(view("alpha"));
  ASSERT_TRUE(raw.has_value());
  EXPECT_EQ(glyphvault::schema::make_string(*raw), "1");

  auto counter = storage.get<uint64_t>(encoder, view("counter"));
  ASSERT_TRUE(counter.has_value());
  EXPECT_EQ(*counter, 42u);

  EXPECT_FALSE(storage.get(view("missing")).has_value());
  EXPECT_FALSE(storage.get<uint64_t>(encoder, view("missing")).has_value());
}

TEST(storage_types, prefix_scan_is_ordered_and_bounded) {
  auto db = glyphvault::testing::scoped_path{"glyphvault_storage_scan"};
  auto storage = glyphvault::storage::make_storage<
      glyphvault::storage::rocksdb_storage_tag>(db.str());

  auto batch = glyphvault::storage::write_batch{};
  batch.put(view("p|b"), view("2"));
  batch.put(view("p|a"), view("1"));
  batch.put(view("p|c"), view("3"));
  batch.put(view("q|a"), view("x"));
  batch.put(view("o|z"), view("y"));
  storage.commit(batch);

  auto keys = std::vector<std::string>{};
  storage.scan_prefix(view("p|"), [&](const auto& key, const auto&) {
    keys.push_back(glyphvault::schema::make_string(key));
    return true;
  });
  EXPECT_EQ(keys, (std::vector<std::string>{"p|a", "p|b", "p|c"}));

  auto visited = 0;
  storage.scan_prefix(view("p|"), [&](const auto&, const auto&) {
    ++visited;
    return visited < 2;
  });
  EXPECT_EQ(visited, 2);
}

TEST(storage_types, undecodable_value_raises_storage_error) {
  auto db = glyphvault::testing::scoped_path{"glyphvault_storage_decode"};
  auto storage = glyphvault::storage::make_storage<
      glyphvault::storage::rocksdb_storage_tag>(db.str());

  auto batch = glyphvault::storage::write_batch{};
  batch.put(view("short"), view("ab"));
  storage.commit(batch);

  auto encoder = encoder_t{};
  EXPECT_THROW(storage.get<uint64_t>(encoder, view("short")),
               glyphvault::storage_error);
}

TEST(storage_types, data_survives_reopen) {
  auto db = glyphvault::testing::scoped_path{"glyphvault_storage_reopen"};
  {
    auto storage = glyphvault::storage::make_storage<
        glyphvault::storage::rocksdb_storage_tag>(db.str());
    auto batch = glyphvault::storage::write_batch{};
    batch.put(view("key"), view("value"));
    storage.commit(batch);
  }
  auto storage = glyphvault::storage::make_storage<
      glyphvault::storage::rocksdb_storage_tag>(db.str());
  auto value = storage.get(view("key"));
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(glyphvault::schema::make_string(*value), "value");
}

TEST(storage_types, open_failure_raises_storage_error) {
  auto dir = glyphvault::testing::scoped_path{"glyphvault_storage_blocked"};
  std::filesystem::create_directories(dir.path());
  auto blocker = dir.path() / "not_a_directory";
  {
    auto out = std::ofstream{blocker};
    out << "file";
  }
  EXPECT_THROW(glyphvault::storage::make_storage<
                   glyphvault::storage::rocksdb_storage_tag>(
                   (blocker / "db").string()),
               glyphvault::storage_error);
}
