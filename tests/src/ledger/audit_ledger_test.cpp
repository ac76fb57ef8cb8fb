#include <glyphvault/common/error.hpp>
#include <glyphvault/ledger/audit_ledger.hpp>
#include <glyphvault/testing/common.hpp>
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

namespace {

glyphvault::schema::glyph_summary_t make_summary(
    const uint8_t seed,
    const std::string& source,
    const glyphvault::schema::timestamp_seconds_t timestamp,
    const bool verified = true) {
  return glyphvault::schema::glyph_summary_t{
      .id = glyphvault::testing::make_hash(seed),
      .data_hash = glyphvault::testing::make_hash(seed + 100),
      .source = source,
      .timestamp = timestamp,
      .signer = "glyphvault:server",
      .signature = glyphvault::schema::bytes_t(32, seed),
      .verified = verified};
}

}  // namespace

TEST(audit_ledger, record_glyph_writes_row_and_created_entry) {
  auto db = glyphvault::testing::scoped_path{"glyphvault_ledger_record"};
  auto ledger = glyphvault::ledger::audit_ledger{db.path()};
  auto summary = make_summary(1, "upload://1", 100);
  ledger.record_glyph(summary, "alice");

  auto loaded = ledger.get_glyph(summary.id);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded, summary);
  EXPECT_TRUE(ledger.contains(summary.id));

  auto trail = ledger.audit_trail(summary.id);
  ASSERT_EQ(trail.size(), 1u);
  EXPECT_EQ(trail[0].action, "CREATED");
  EXPECT_EQ(trail[0].actor, "alice");
  EXPECT_EQ(trail[0].metadata["source"].asString(), "upload://1");
  EXPECT_EQ(trail[0].metadata["signer"].asString(), "glyphvault:server");
}

TEST(audit_ledger, recording_an_existing_id_is_rejected) {
  auto db = glyphvault::testing::scoped_path{"glyphvault_ledger_rerecord"};
  auto ledger = glyphvault::ledger::audit_ledger{db.path()};
  auto summary = make_summary(1, "upload://1", 100);
  ledger.record_glyph(summary, "alice");

  auto replacement = summary;
  replacement.timestamp = 500;
  replacement.source = "upload://other";
  EXPECT_THROW(ledger.record_glyph(replacement, "mallory"),
               std::invalid_argument);

  EXPECT_EQ(*ledger.get_glyph(summary.id), summary);
  EXPECT_EQ(ledger.audit_trail(summary.id).size(), 1u);
  auto rows = ledger.list(std::nullopt, 10, 0);
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].timestamp, 100u);

  // The sequence is not consumed by the rejected write.
  ledger.log_action(summary.id, "VIEWED", "alice");
  auto trail = ledger.audit_trail(summary.id);
  ASSERT_EQ(trail.size(), 2u);
  EXPECT_EQ(trail[0].sequence, trail[1].sequence + 1);
}

TEST(audit_ledger, audit_trail_is_newest_first_with_rising_sequences) {
  auto db = glyphvault::testing::scoped_path{"glyphvault_ledger_trail"};
  auto ledger = glyphvault::ledger::audit_ledger{db.path()};
  auto summary = make_summary(1, "upload://1", 100);
  ledger.record_glyph(summary, "system");

  auto metadata = Json::Value{Json::objectValue};
  metadata["cid"] = "bafk1";
  auto published =
      ledger.log_action(summary.id, "PUBLISHED", "bob", metadata);
  auto reviewed = ledger.log_action(summary.id, "REVIEWED", "carol");
  EXPECT_GT(reviewed.sequence, published.sequence);

  auto trail = ledger.audit_trail(summary.id);
  ASSERT_EQ(trail.size(), 3u);
  EXPECT_EQ(trail[0].action, "REVIEWED");
  EXPECT_EQ(trail[1].action, "PUBLISHED");
  EXPECT_EQ(trail[1].metadata["cid"].asString(), "bafk1");
  EXPECT_EQ(trail[2].action, "CREATED");
}

TEST(audit_ledger, follow_up_entries_commit_with_the_glyph) {
  auto db = glyphvault::testing::scoped_path{"glyphvault_ledger_followup"};
  auto ledger = glyphvault::ledger::audit_ledger{db.path()};
  auto summary = make_summary(1, "upload://1", 100);
  ledger.record_glyph(
      summary, "system",
      {glyphvault::ledger::action_record{.glyph_id = summary.id,
                                         .action = "RECOVERED",
                                         .actor = "system"}});
  auto trail = ledger.audit_trail(summary.id);
  ASSERT_EQ(trail.size(), 2u);
  EXPECT_EQ(trail[0].action, "RECOVERED");
  EXPECT_EQ(trail[1].action, "CREATED");
}

TEST(audit_ledger, log_action_for_unknown_glyph_raises_not_found) {
  auto db = glyphvault::testing::scoped_path{"glyphvault_ledger_unknown"};
  auto ledger = glyphvault::ledger::audit_ledger{db.path()};
  EXPECT_THROW(ledger.log_action(glyphvault::testing::make_hash(9),
                                 "ANCHORED", "system"),
               glyphvault::not_found_error);
}

TEST(audit_ledger, log_actions_is_all_or_nothing) {
  auto db = glyphvault::testing::scoped_path{"glyphvault_ledger_batch"};
  auto ledger = glyphvault::ledger::audit_ledger{db.path()};
  auto summary = make_summary(1, "upload://1", 100);
  ledger.record_glyph(summary, "system");

  auto records = std::vector<glyphvault::ledger::action_record>{
      {.glyph_id = summary.id, .action = "ANCHORED", .actor = "system"},
      {.glyph_id = glyphvault::testing::make_hash(50),
       .action = "ANCHORED",
       .actor = "system"}};
  EXPECT_THROW(ledger.log_actions(records), glyphvault::not_found_error);
  EXPECT_EQ(ledger.audit_trail(summary.id).size(), 1u);
}

TEST(audit_ledger, rejects_empty_action_and_non_object_metadata) {
  auto db = glyphvault::testing::scoped_path{"glyphvault_ledger_invalid"};
  auto ledger = glyphvault::ledger::audit_ledger{db.path()};
  auto summary = make_summary(1, "upload://1", 100);
  ledger.record_glyph(summary, "system");

  EXPECT_THROW(ledger.log_action(summary.id, "", "system"),
               std::invalid_argument);
  EXPECT_THROW(ledger.log_action(summary.id, "NOTE", "system",
                                 Json::Value{Json::arrayValue}),
               std::invalid_argument);
  EXPECT_EQ(ledger.audit_trail(summary.id).size(), 1u);

  // A rejected batch must not consume sequence numbers.
  auto next = ledger.log_action(summary.id, "NOTE", "system");
  EXPECT_EQ(next.sequence, 1u);
}

TEST(audit_ledger, sequence_resumes_after_reopen) {
  auto db = glyphvault::testing::scoped_path{"glyphvault_ledger_reopen"};
  auto summary = make_summary(1, "upload://1", 100);
  auto last = uint64_t{};
  {
    auto ledger = glyphvault::ledger::audit_ledger{db.path()};
    ledger.record_glyph(summary, "system");
    last = ledger.log_action(summary.id, "NOTE", "system").sequence;
  }
  auto ledger = glyphvault::ledger::audit_ledger{db.path()};
  auto entry = ledger.log_action(summary.id, "NOTE", "system");
  EXPECT_EQ(entry.sequence, last + 1);
  EXPECT_EQ(ledger.audit_trail(summary.id).size(), 3u);
}

TEST(audit_ledger, list_is_newest_first_with_filter_limit_and_offset) {
  auto db = glyphvault::testing::scoped_path{"glyphvault_ledger_list"};
  auto ledger = glyphvault::ledger::audit_ledger{db.path()};
  ledger.record_glyph(make_summary(1, "upload://1", 100), "system");
  ledger.record_glyph(make_summary(2, "upload://2", 300), "system");
  ledger.record_glyph(make_summary(3, "upload://1", 200), "system");

  auto all = ledger.list(std::nullopt, 10, 0);
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].timestamp, 300u);
  EXPECT_EQ(all[1].timestamp, 200u);
  EXPECT_EQ(all[2].timestamp, 100u);

  auto filtered = ledger.list(std::string{"upload://1"}, 10, 0);
  ASSERT_EQ(filtered.size(), 2u);
  EXPECT_EQ(filtered[0].timestamp, 200u);

  auto paged = ledger.list(std::nullopt, 1, 1);
  ASSERT_EQ(paged.size(), 1u);
  EXPECT_EQ(paged[0].timestamp, 200u);

  EXPECT_TRUE(ledger.list(std::nullopt, 0, 0).empty());
  EXPECT_TRUE(ledger.list(std::nullopt, 10, 5).empty());
  EXPECT_TRUE(ledger.list(std::string{"nowhere"}, 10, 0).empty());
}

TEST(audit_ledger, stats_aggregate_rows) {
  auto db = glyphvault::testing::scoped_path{"glyphvault_ledger_stats"};
  auto ledger = glyphvault::ledger::audit_ledger{db.path()};
  EXPECT_EQ(ledger.stats().total_glyphs, 0u);

  ledger.record_glyph(make_summary(1, "upload://1", 100), "system");
  ledger.record_glyph(make_summary(2, "upload://2", 300, false), "system");
  ledger.record_glyph(make_summary(3, "upload://1", 200), "system");

  auto stats = ledger.stats();
  EXPECT_EQ(stats.total_glyphs, 3u);
  EXPECT_EQ(stats.verified_count, 2u);
  EXPECT_EQ(stats.sources.at("upload://1"), 2u);
  EXPECT_EQ(stats.sources.at("upload://2"), 1u);
  EXPECT_EQ(stats.latest_timestamp, 300u);
  EXPECT_TRUE(stats.storage_path.empty());
}
