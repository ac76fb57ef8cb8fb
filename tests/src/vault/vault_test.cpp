#include <glyphvault/common/error.hpp>
#include <glyphvault/content/hasher.hpp>
#include <glyphvault/testing/common.hpp>
#include <glyphvault/testing/fake_chain.hpp>
#include <glyphvault/testing/fake_gateway.hpp>
#include <glyphvault/vault/vault.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace {

using glyphvault::testing::kTestKdfIterations;
using glyphvault::testing::kTestPassphrase;

glyphvault::vault::vault_config make_config(
    const std::filesystem::path& path,
    glyphvault::glyph::signing_identity identity =
        glyphvault::glyph::local_key{
            .key = glyphvault::testing::make_signing_key(1)}) {
  return glyphvault::vault::vault_config{
      .path = path,
      .passphrase = std::string{kTestPassphrase},
      .identity = std::move(identity),
      .kdf_iterations = kTestKdfIterations};
}

Json::Value make_payload(const int n = 0) {
  auto data = glyphvault::content::parse(R"({"title":"A","body":"B"})");
  data["n"] = n;
  return data;
}

std::filesystem::path blob_file(const std::filesystem::path& root,
                                const glyphvault::schema::glyph_id_t& id) {
  return root / "blobs" / (glyphvault::schema::to_hex(id) + ".glyph");
}

std::vector<std::string> actions(
    const std::vector<glyphvault::schema::audit_entry_t>& trail) {
  auto out = std::vector<std::string>{};
  for (const auto& entry : trail) {
    out.push_back(entry.action);
  }
  return out;
}

}  // namespace

TEST(vault, create_retrieve_and_proof_round_trip) {
  auto dir = glyphvault::testing::scoped_path{"glyphvault_vault_e2e"};
  auto vault = glyphvault::vault::vault{make_config(dir.path())};

  auto glyph = vault.create(make_payload(), "upload://1", "alice");
  EXPECT_TRUE(glyph.verified);
  EXPECT_EQ(glyph.signer, vault.signer());

  auto loaded = vault.retrieve(glyph.id);
  EXPECT_EQ(loaded, glyph);
  ASSERT_TRUE(loaded.data.has_value());
  EXPECT_EQ(*loaded.data, make_payload());
  EXPECT_TRUE(vault.verify_signature(loaded));

  auto report = vault.proof(glyph.id);
  EXPECT_EQ(report.glyph_id, glyph.id);
  EXPECT_EQ(report.data_hash, glyph.data_hash);
  EXPECT_EQ(report.source, "upload://1");
  EXPECT_TRUE(report.signature_valid);
  EXPECT_EQ(report.assurance,
            glyphvault::schema::assurance_level::local_signature);
  EXPECT_GE(report.proof_generated_at, glyph.timestamp);
  ASSERT_EQ(report.audit_trail.size(), 1u);
  EXPECT_EQ(report.audit_trail[0].action, "CREATED");
  EXPECT_EQ(report.audit_trail[0].actor, "alice");
}

TEST(vault, server_attestation_vault_reports_lower_assurance) {
  auto dir = glyphvault::testing::scoped_path{"glyphvault_vault_server"};
  auto vault = glyphvault::vault::vault{
      make_config(dir.path(), glyphvault::glyph::server_attestation{})};
  EXPECT_EQ(vault.assurance(),
            glyphvault::schema::assurance_level::server_attestation);

  auto glyph = vault.create(make_payload(), "upload://1");
  EXPECT_EQ(glyph.signer, glyphvault::schema::kServerSigner);
  auto report = vault.proof(glyph.id);
  EXPECT_TRUE(report.signature_valid);
  EXPECT_EQ(report.assurance,
            glyphvault::schema::assurance_level::server_attestation);
}

TEST(vault, resubmission_returns_stored_glyph_and_logs_it) {
  auto dir = glyphvault::testing::scoped_path{"glyphvault_vault_resubmit"};
  auto vault = glyphvault::vault::vault{make_config(dir.path())};

  auto first = vault.create(make_payload(), "upload://1");
  auto second = vault.create(make_payload(), "upload://1", "bob");
  EXPECT_EQ(second.id, first.id);
  EXPECT_EQ(second.timestamp, first.timestamp);
  EXPECT_EQ(vault.stats().total_glyphs, 1u);

  auto trail = vault.proof(first.id).audit_trail;
  EXPECT_EQ(actions(trail),
            (std::vector<std::string>{"RESUBMITTED", "CREATED"}));
  EXPECT_EQ(trail[0].actor, "bob");
}

TEST(vault, same_content_from_another_source_is_a_new_glyph) {
  auto dir = glyphvault::testing::scoped_path{"glyphvault_vault_sources"};
  auto vault = glyphvault::vault::vault{make_config(dir.path())};
  auto first = vault.create(make_payload(), "upload://1");
  auto second = vault.create(make_payload(), "upload://2");
  EXPECT_NE(first.id, second.id);
  EXPECT_EQ(first.data_hash, second.data_hash);
  EXPECT_EQ(vault.stats().total_glyphs, 2u);
}

TEST(vault, resubmission_restores_missing_blob) {
  auto dir = glyphvault::testing::scoped_path{"glyphvault_vault_restore"};
  auto vault = glyphvault::vault::vault{make_config(dir.path())};
  auto glyph = vault.create(make_payload(), "upload://1");

  std::filesystem::remove(blob_file(dir.path(), glyph.id));
  auto metadata_only = vault.retrieve(glyph.id);
  EXPECT_EQ(metadata_only.id, glyph.id);
  EXPECT_EQ(metadata_only.data_hash, glyph.data_hash);
  EXPECT_FALSE(metadata_only.data.has_value());

  auto restored = vault.create(make_payload(), "upload://1");
  EXPECT_TRUE(std::filesystem::exists(blob_file(dir.path(), glyph.id)));
  ASSERT_TRUE(restored.data.has_value());
  EXPECT_EQ(*restored.data, make_payload());
  EXPECT_EQ(restored.timestamp, glyph.timestamp);
  EXPECT_EQ(restored.signature, glyph.signature);
}

TEST(vault, unknown_id_raises_not_found) {
  auto dir = glyphvault::testing::scoped_path{"glyphvault_vault_missing"};
  auto vault = glyphvault::vault::vault{make_config(dir.path())};
  auto id = glyphvault::testing::make_hash(77);
  EXPECT_THROW(vault.retrieve(id), glyphvault::not_found_error);
  EXPECT_THROW(vault.proof(id), glyphvault::not_found_error);
  EXPECT_THROW(vault.log_action(id, "NOTE", "alice"),
               glyphvault::not_found_error);
}

TEST(vault, tampered_blob_raises_integrity_error) {
  auto dir = glyphvault::testing::scoped_path{"glyphvault_vault_tamper"};
  auto vault = glyphvault::vault::vault{make_config(dir.path())};
  auto glyph = vault.create(make_payload(), "upload://1");

  auto path = blob_file(dir.path(), glyph.id);
  auto bytes = std::string{};
  {
    auto in = std::ifstream{path, std::ios::binary};
    bytes.assign(std::istreambuf_iterator<char>{in},
                 std::istreambuf_iterator<char>{});
  }
  bytes.back() = static_cast<char>(bytes.back() ^ 0x01);
  {
    auto out = std::ofstream{path, std::ios::binary | std::ios::trunc};
    out << bytes;
  }
  EXPECT_THROW(vault.retrieve(glyph.id), glyphvault::integrity_error);
  EXPECT_THROW(vault.proof(glyph.id), glyphvault::integrity_error);
}

TEST(vault, proof_fails_when_payload_no_longer_matches_hash) {
  auto dir = glyphvault::testing::scoped_path{"glyphvault_vault_swap"};
  auto vault = glyphvault::vault::vault{make_config(dir.path())};
  auto glyph = vault.create(make_payload(), "upload://1");
  EXPECT_TRUE(vault.proof(glyph.id).signature_valid);

  // A well-formed blob whose payload was swapped under the same id.
  auto swapped = glyph;
  swapped.data = glyphvault::content::parse(R"({"title":"forged"})");
  {
    auto store = glyphvault::vault::encrypted_store{
        dir.path(), kTestPassphrase, kTestKdfIterations};
    store.put(swapped);
  }
  EXPECT_THROW(vault.proof(glyph.id), glyphvault::integrity_error);
}

TEST(vault, orphan_blob_is_recovered_on_open) {
  auto dir = glyphvault::testing::scoped_path{"glyphvault_vault_recover"};
  auto factory = glyphvault::glyph::factory{glyphvault::glyph::local_key{
      .key = glyphvault::testing::make_signing_key(1)}};
  auto glyph = factory.create(make_payload(), "upload://1");
  {
    auto store = glyphvault::vault::encrypted_store{
        dir.path(), kTestPassphrase, kTestKdfIterations};
    store.put(glyph);
  }

  auto vault = glyphvault::vault::vault{make_config(dir.path())};
  auto loaded = vault.retrieve(glyph.id);
  EXPECT_EQ(loaded, glyph);
  EXPECT_EQ(actions(vault.proof(glyph.id).audit_trail),
            (std::vector<std::string>{"RECOVERED", "CREATED"}));
  EXPECT_EQ(vault.recover(), 0u);
}

TEST(vault, reopen_keeps_ledger_and_blobs) {
  auto dir = glyphvault::testing::scoped_path{"glyphvault_vault_reopen"};
  auto id = glyphvault::schema::glyph_id_t{};
  {
    auto vault = glyphvault::vault::vault{make_config(dir.path())};
    id = vault.create(make_payload(), "upload://1").id;
  }
  auto vault = glyphvault::vault::vault{make_config(dir.path())};
  EXPECT_EQ(vault.retrieve(id).id, id);
  EXPECT_EQ(vault.proof(id).audit_trail.size(), 1u);
}

TEST(vault, wrong_passphrase_cannot_open_vault) {
  auto dir = glyphvault::testing::scoped_path{"glyphvault_vault_passphrase"};
  {
    auto vault = glyphvault::vault::vault{make_config(dir.path())};
    vault.create(make_payload(), "upload://1");
  }
  auto config = make_config(dir.path());
  config.passphrase = "battery staple";
  EXPECT_THROW(glyphvault::vault::vault{std::move(config)},
               glyphvault::integrity_error);
}

TEST(vault, concurrent_creates_record_each_glyph_once) {
  auto dir = glyphvault::testing::scoped_path{"glyphvault_vault_threads"};
  auto vault = glyphvault::vault::vault{make_config(dir.path())};

  constexpr auto kThreads = 8;
  constexpr auto kPerThread = 5;
  auto workers = std::vector<std::thread>{};
  for (auto t = 0; t < kThreads; ++t) {
    workers.emplace_back([&vault, t] {
      for (auto i = 0; i < kPerThread; ++i) {
        vault.create(make_payload(t * kPerThread + i), "upload://threads");
        // Every thread also races on one shared glyph.
        vault.create(make_payload(-1), "upload://shared");
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  auto stats = vault.stats();
  EXPECT_EQ(stats.total_glyphs, kThreads * kPerThread + 1u);
  EXPECT_EQ(stats.sources.at("upload://shared"), 1u);

  auto shared = vault.list(std::string{"upload://shared"});
  ASSERT_EQ(shared.size(), 1u);
  auto trail = vault.proof(shared[0].id).audit_trail;
  EXPECT_EQ(trail.size(), static_cast<std::size_t>(kThreads * kPerThread));
  EXPECT_EQ(trail.back().action, "CREATED");

  auto sequences = std::set<uint64_t>{};
  for (const auto& entry : trail) {
    sequences.insert(entry.sequence);
  }
  EXPECT_EQ(sequences.size(), trail.size());
}

TEST(vault, list_and_stats_reflect_vault_contents) {
  auto dir = glyphvault::testing::scoped_path{"glyphvault_vault_list"};
  auto vault = glyphvault::vault::vault{make_config(dir.path())};
  vault.create(make_payload(1), "upload://1");
  vault.create(make_payload(2), "upload://2");
  vault.create(make_payload(3), "upload://1");

  EXPECT_EQ(vault.list().size(), 3u);
  EXPECT_EQ(vault.list(std::string{"upload://1"}).size(), 2u);
  EXPECT_EQ(vault.list(std::nullopt, 2, 0).size(), 2u);
  EXPECT_EQ(vault.list(std::nullopt, 10, 2).size(), 1u);

  auto stats = vault.stats();
  EXPECT_EQ(stats.total_glyphs, 3u);
  EXPECT_EQ(stats.verified_count, 3u);
  EXPECT_EQ(stats.sources.at("upload://1"), 2u);
  EXPECT_EQ(stats.storage_path, dir.str());
}

TEST(vault, custom_actions_land_in_the_trail) {
  auto dir = glyphvault::testing::scoped_path{"glyphvault_vault_actions"};
  auto vault = glyphvault::vault::vault{make_config(dir.path())};
  auto glyph = vault.create(make_payload(), "upload://1");

  auto metadata = Json::Value{Json::objectValue};
  metadata["ticket"] = "QA-7";
  auto entry = vault.log_action(glyph.id, "REVIEWED", "carol", metadata);
  EXPECT_EQ(entry.action, "REVIEWED");

  auto trail = vault.proof(glyph.id).audit_trail;
  ASSERT_EQ(trail.size(), 2u);
  EXPECT_EQ(trail[0].metadata["ticket"].asString(), "QA-7");
}

TEST(vault, merkle_helpers_match_tree) {
  auto dir = glyphvault::testing::scoped_path{"glyphvault_vault_merkle"};
  auto vault = glyphvault::vault::vault{make_config(dir.path())};
  auto ids = std::vector<glyphvault::schema::glyph_id_t>{
      vault.create(make_payload(), "upload://1").id,
      vault.create(make_payload(), "upload://2").id};

  auto root = vault.merkle_root(ids);
  EXPECT_EQ(root, glyphvault::merkle::root(ids));
  auto proof = vault.inclusion_proof(ids, ids[1]);
  ASSERT_TRUE(proof.has_value());
  EXPECT_TRUE(vault.verify_inclusion(root, ids[1], *proof));
  EXPECT_FALSE(vault.inclusion_proof(ids, glyphvault::testing::make_hash(9))
                   .has_value());
}

TEST(vault, anchoring_without_chain_client_is_a_configuration_error) {
  auto dir = glyphvault::testing::scoped_path{"glyphvault_vault_nochain"};
  auto vault = glyphvault::vault::vault{make_config(dir.path())};
  auto glyph = vault.create(make_payload(), "upload://1");
  EXPECT_THROW(vault.anchor({glyph.id}), glyphvault::configuration_error);
  EXPECT_THROW(vault.anchor_status(glyphvault::merkle::root({glyph.id})),
               glyphvault::configuration_error);
}

TEST(vault, confirmed_anchor_logs_anchored_for_recorded_ids) {
  auto dir = glyphvault::testing::scoped_path{"glyphvault_vault_anchor"};
  auto chain = std::make_shared<glyphvault::testing::fake_chain>();
  auto client = std::make_unique<glyphvault::chain::anchor_client>(
      glyphvault::testing::make_test_chain_config(
          glyphvault::testing::make_signing_key(1),
          glyphvault::testing::make_contract_address()),
      chain);
  auto vault =
      glyphvault::vault::vault{make_config(dir.path()), std::move(client)};

  auto first = vault.create(make_payload(1), "upload://1");
  auto second = vault.create(make_payload(2), "upload://1");
  auto stranger = glyphvault::testing::make_hash(200);
  auto ids = std::vector<glyphvault::schema::glyph_id_t>{first.id, second.id,
                                                         stranger};

  auto result = vault.anchor(ids, "anchor-bot");
  EXPECT_EQ(result.status, glyphvault::schema::anchor_status::confirmed);
  EXPECT_EQ(result.root, glyphvault::merkle::root(ids));

  auto trail = vault.proof(first.id).audit_trail;
  ASSERT_EQ(trail.size(), 2u);
  EXPECT_EQ(trail[0].action, "ANCHORED");
  EXPECT_EQ(trail[0].actor, "anchor-bot");
  EXPECT_EQ(trail[0].metadata["tx_hash"].asString(), result.tx_hash);
  EXPECT_EQ(trail[0].metadata["root"].asString(),
            glyphvault::schema::to_prefixed_hex(result.root));
  EXPECT_EQ(vault.proof(second.id).audit_trail[0].action, "ANCHORED");

  auto state = vault.anchor_status(result.root);
  EXPECT_TRUE(state.anchored);

  // Anchoring the same set again is a no-op on chain and in the ledger.
  auto again = vault.anchor(ids);
  EXPECT_EQ(again.status, glyphvault::schema::anchor_status::already_anchored);
  EXPECT_EQ(vault.proof(first.id).audit_trail.size(), 2u);
  EXPECT_EQ(chain->transactions().size(), 1u);
}

TEST(vault, reverted_anchor_leaves_ledger_untouched) {
  auto dir = glyphvault::testing::scoped_path{"glyphvault_vault_revert"};
  auto chain = std::make_shared<glyphvault::testing::fake_chain>();
  chain->set_revert(true);
  auto client = std::make_unique<glyphvault::chain::anchor_client>(
      glyphvault::testing::make_test_chain_config(
          glyphvault::testing::make_signing_key(1),
          glyphvault::testing::make_contract_address()),
      chain);
  auto vault =
      glyphvault::vault::vault{make_config(dir.path()), std::move(client)};
  auto glyph = vault.create(make_payload(), "upload://1");

  EXPECT_THROW(vault.anchor({glyph.id}), glyphvault::chain_error);
  EXPECT_EQ(vault.proof(glyph.id).audit_trail.size(), 1u);
}

TEST(vault, ingest_and_publish_through_gateway) {
  auto dir = glyphvault::testing::scoped_path{"glyphvault_vault_gateway"};
  auto vault = glyphvault::vault::vault{make_config(dir.path())};
  auto gateway = glyphvault::testing::fake_gateway{};
  gateway.put("bafkexample", make_payload(5));

  auto ingested = vault.ingest(gateway, "bafkexample", "importer");
  EXPECT_EQ(ingested.source, "ipfs://bafkexample");
  EXPECT_EQ(ingested.data_hash, glyphvault::content::hash(make_payload(5)));
  EXPECT_THROW(vault.ingest(gateway, "bafkunknown"), std::runtime_error);

  auto local = vault.create(make_payload(6), "upload://1");
  auto cid = vault.publish(local.id, gateway, "publisher");
  EXPECT_TRUE(gateway.contains(cid));
  EXPECT_EQ(gateway.download(cid), make_payload(6));

  auto trail = vault.proof(local.id).audit_trail;
  ASSERT_EQ(trail.size(), 2u);
  EXPECT_EQ(trail[0].action, "PUBLISHED");
  EXPECT_EQ(trail[0].metadata["cid"].asString(), cid);
}
