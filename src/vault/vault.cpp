#include <glyphvault/common/error.hpp>
#include <glyphvault/content/hasher.hpp>
#include <glyphvault/vault/vault.hpp>

#include <spdlog/spdlog.h>

#include <set>

using namespace glyphvault::schema;

namespace glyphvault::vault {

namespace {

constexpr auto kLedgerDir = std::string_view{"ledger"};

glyph_summary_t summarize(const glyph_t& glyph) {
  return glyph_summary_t{.id = glyph.id,
                         .data_hash = glyph.data_hash,
                         .source = glyph.source,
                         .timestamp = glyph.timestamp,
                         .signer = glyph.signer,
                         .signature = glyph.signature,
                         .verified = glyph.verified};
}

glyph_t from_summary(const glyph_summary_t& summary) {
  auto glyph = glyph_t{};
  glyph.id = summary.id;
  glyph.data_hash = summary.data_hash;
  glyph.source = summary.source;
  glyph.timestamp = summary.timestamp;
  glyph.signer = summary.signer;
  glyph.signature = summary.signature;
  glyph.verified = summary.verified;
  return glyph;
}

}  // namespace

vault::vault(vault_config config,
             std::unique_ptr<glyphvault::chain::anchor_client> chain_client)
    : path_(std::move(config.path)),
      factory_(std::move(config.identity)),
      store_(path_, config.passphrase, config.kdf_iterations),
      ledger_(path_ / kLedgerDir),
      chain_(std::move(chain_client)) {
  auto replayed = recover();
  spdlog::info("Opened vault at {} (signer {}, {} recovered)", path_.string(),
               factory_.signer(), replayed);
}

std::mutex& vault::lock_for(const glyph_id_t& id) const {
  return locks_[id[0] % kLockStripes];
}

glyph_t vault::create(const Json::Value& data,
                      const std::string& source,
                      const std::string_view actor) {
  auto glyph = factory_.create(data, source);
  auto lock = std::scoped_lock{lock_for(glyph.id)};

  if (auto existing = ledger_.get_glyph(glyph.id); existing.has_value()) {
    auto metadata = Json::Value{Json::objectValue};
    metadata["source"] = source;
    ledger_.log_action(glyph.id, audit_action::kResubmitted, actor, metadata);
    spdlog::info("Glyph {} already recorded; returning stored copy",
                 to_prefixed_hex(glyph.id));
    if (!store_.contains(glyph.id)) {
      auto restored = from_summary(*existing);
      restored.data = glyph.data;
      store_.put(restored);
      spdlog::warn("Restored missing payload blob for {}",
                   to_prefixed_hex(glyph.id));
    }
    return retrieve(glyph.id);
  }

  store_.put(glyph);
  ledger_.record_glyph(summarize(glyph), actor);
  return glyph;
}

glyph_t vault::retrieve(const glyph_id_t& id) const {
  auto id_text = to_prefixed_hex(id);
  auto summary = ledger_.get_glyph(id);
  auto stored = store_.get(id);

  if (!stored.has_value()) {
    if (!summary.has_value()) {
      throw glyphvault::not_found_error("glyph " + id_text + " not found");
    }
    spdlog::warn("Payload for {} is missing; returning ledger metadata only",
                 id_text);
    return from_summary(*summary);
  }

  if (!stored->data.has_value()) {
    throw glyphvault::integrity_error("stored glyph " + id_text +
                                      " carries no payload");
  }
  if (glyphvault::content::hash(*stored->data) != stored->data_hash ||
      (summary.has_value() && summary->data_hash != stored->data_hash)) {
    spdlog::error("Payload for {} does not match its data hash", id_text);
    throw glyphvault::integrity_error("payload for " + id_text +
                                      " does not match its data hash");
  }
  return *stored;
}

proof_report_t vault::proof(const glyph_id_t& id) const {
  // A payload that no longer matches its hash must not yield a clean proof.
  retrieve(id);
  auto summary = ledger_.get_glyph(id);
  if (!summary.has_value()) {
    throw glyphvault::not_found_error("glyph " + to_prefixed_hex(id) +
                                      " not found");
  }
  auto report = proof_report_t{};
  report.glyph_id = summary->id;
  report.data_hash = summary->data_hash;
  report.source = summary->source;
  report.timestamp = summary->timestamp;
  report.signer = summary->signer;
  report.signature = summary->signature;
  report.signature_valid = glyphvault::glyph::verify_signature(
      summary->data_hash, summary->signer, summary->signature);
  report.assurance = glyphvault::glyph::assurance(summary->signer);
  report.verified = summary->verified;
  report.audit_trail = ledger_.audit_trail(id);
  report.proof_generated_at = now_seconds();
  return report;
}

bool vault::verify_signature(const glyph_t& glyph) const {
  return glyphvault::glyph::verify(glyph);
}

std::vector<glyph_summary_t> vault::list(
    const std::optional<std::string>& source,
    const std::size_t limit,
    const std::size_t offset) const {
  return ledger_.list(source, limit, offset);
}

vault_stats vault::stats() const {
  auto stats = ledger_.stats();
  stats.storage_path = path_.string();
  return stats;
}

audit_entry_t vault::log_action(const glyph_id_t& id,
                                const std::string_view action,
                                const std::string_view actor,
                                const Json::Value& metadata) {
  return ledger_.log_action(id, action, actor, metadata);
}

hash32_t vault::merkle_root(const std::vector<glyph_id_t>& ids) const {
  return glyphvault::merkle::root(ids);
}

std::optional<glyphvault::merkle::proof_t> vault::inclusion_proof(
    const std::vector<glyph_id_t>& ids,
    const glyph_id_t& id) const {
  return glyphvault::merkle::proof(ids, id);
}

bool vault::verify_inclusion(const hash32_t& root,
                             const glyph_id_t& id,
                             const glyphvault::merkle::proof_t& proof) const {
  return glyphvault::merkle::verify(root, id, proof);
}

anchor_result_t vault::anchor(const std::vector<glyph_id_t>& ids,
                              const std::string_view actor,
                              std::stop_token stop) {
  if (!chain_) {
    throw glyphvault::configuration_error(
        "anchoring requires a chain client; none is configured");
  }
  auto result = chain_->anchor(ids, std::move(stop));
  if (result.status != anchor_status::confirmed) {
    return result;
  }

  auto metadata = Json::Value{Json::objectValue};
  metadata["root"] = to_prefixed_hex(result.root);
  metadata["tx_hash"] = result.tx_hash;
  metadata["block_number"] = Json::UInt64{result.block_number};

  auto seen = std::set<glyph_id_t>{};
  auto records = std::vector<glyphvault::ledger::action_record>{};
  for (const auto& id : ids) {
    if (!seen.insert(id).second) {
      continue;
    }
    if (!ledger_.contains(id)) {
      spdlog::debug("Anchored id {} is not in this vault's ledger",
                    to_prefixed_hex(id));
      continue;
    }
    records.push_back(glyphvault::ledger::action_record{
        .glyph_id = id,
        .action = std::string{audit_action::kAnchored},
        .actor = std::string{actor},
        .metadata = metadata});
  }
  ledger_.log_actions(records);
  return result;
}

anchor_state vault::anchor_status(const hash32_t& root) {
  if (!chain_) {
    throw glyphvault::configuration_error(
        "anchor status requires a chain client; none is configured");
  }
  return chain_->is_anchored(root);
}

std::size_t vault::recover(const std::string_view actor) {
  auto replayed = std::size_t{};
  for (const auto& id : store_.ids()) {
    auto lock = std::scoped_lock{lock_for(id)};
    if (ledger_.contains(id)) {
      continue;
    }
    auto id_text = to_prefixed_hex(id);
    auto glyph = std::optional<glyph_t>{};
    try {
      glyph = store_.get(id);
    } catch (const glyphvault::integrity_error& e) {
      spdlog::error("Cannot recover orphan blob {}: {}", id_text, e.what());
      continue;
    }
    if (!glyph.has_value()) {
      continue;
    }

    auto metadata = Json::Value{Json::objectValue};
    metadata["reason"] = "payload stored without ledger row";
    ledger_.record_glyph(
        summarize(*glyph), actor,
        {glyphvault::ledger::action_record{
            .glyph_id = id,
            .action = std::string{audit_action::kRecovered},
            .actor = std::string{actor},
            .metadata = metadata}});
    spdlog::warn("Recovered glyph {} from an orphaned payload blob", id_text);
    ++replayed;
  }
  return replayed;
}

glyph_t vault::ingest(glyphvault::gateway::content_gateway& gateway,
                      const std::string& cid,
                      const std::string_view actor) {
  auto data = gateway.download(cid);
  auto source = std::string{kIpfsScheme} + cid;
  spdlog::info("Ingesting {} from content gateway", source);
  return create(data, source, actor);
}

std::string vault::publish(const glyph_id_t& id,
                           glyphvault::gateway::content_gateway& gateway,
                           const std::string_view actor) {
  auto glyph = retrieve(id);
  if (!glyph.data.has_value()) {
    throw glyphvault::not_found_error("payload for " + to_prefixed_hex(id) +
                                      " is not available to publish");
  }
  auto cid = gateway.upload(*glyph.data);
  auto metadata = Json::Value{Json::objectValue};
  metadata["cid"] = cid;
  ledger_.log_action(id, audit_action::kPublished, actor, metadata);
  spdlog::info("Published {} as {}", to_prefixed_hex(id), cid);
  return cid;
}

}  // namespace glyphvault::vault
