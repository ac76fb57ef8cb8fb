#pragma once

#include <glyphvault/chain/anchor_client.hpp>
#include <glyphvault/gateway/content_gateway.hpp>
#include <glyphvault/glyph/factory.hpp>
#include <glyphvault/ledger/audit_ledger.hpp>
#include <glyphvault/merkle/tree.hpp>
#include <glyphvault/schema/anchor_result.hpp>
#include <glyphvault/schema/audit_entry.hpp>
#include <glyphvault/schema/glyph.hpp>
#include <glyphvault/schema/glyph_summary.hpp>
#include <glyphvault/schema/proof_report.hpp>
#include <glyphvault/schema/vault_stats.hpp>
#include <glyphvault/vault/encrypted_store.hpp>
#include <json/value.h>
#include <array>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace glyphvault::vault {

inline constexpr auto kSystemActor = std::string_view{"system"};
inline constexpr auto kDefaultListLimit = std::size_t{100};
inline constexpr auto kIpfsScheme = std::string_view{"ipfs://"};

struct vault_config final {
  std::filesystem::path path;
  std::string passphrase;
  glyphvault::glyph::signing_identity identity;
  uint32_t kdf_iterations{kDefaultKdfIterations};
};

/// One vault directory: encrypted blobs, the audit ledger and the identity
/// that signs new glyphs. Safe to share across threads.
class vault final {
 public:
  /// Opens (or initializes) the vault and replays any blob that is missing
  /// its ledger row. `chain_client` may be null when anchoring is not
  /// needed.
  explicit vault(
      vault_config config,
      std::unique_ptr<glyphvault::chain::anchor_client> chain_client = nullptr);

  vault(const vault&) = delete;
  vault& operator=(const vault&) = delete;

  /// Builds, encrypts and records a glyph. Resubmitting content that is
  /// already recorded returns the stored glyph and logs RESUBMITTED.
  glyphvault::schema::glyph_t create(const Json::Value& data,
                                     const std::string& source,
                                     std::string_view actor = kSystemActor);

  /// Throws not_found_error for an unknown id and integrity_error when the
  /// payload fails authentication or no longer matches data_hash. When only
  /// the ledger row survives, the glyph comes back without data.
  glyphvault::schema::glyph_t retrieve(
      const glyphvault::schema::glyph_id_t& id) const;

  glyphvault::schema::proof_report_t proof(
      const glyphvault::schema::glyph_id_t& id) const;

  bool verify_signature(const glyphvault::schema::glyph_t& glyph) const;

  std::vector<glyphvault::schema::glyph_summary_t> list(
      const std::optional<std::string>& source = std::nullopt,
      std::size_t limit = kDefaultListLimit,
      std::size_t offset = 0) const;

  glyphvault::schema::vault_stats stats() const;

  glyphvault::schema::audit_entry_t log_action(
      const glyphvault::schema::glyph_id_t& id,
      std::string_view action,
      std::string_view actor,
      const Json::Value& metadata = Json::Value{Json::objectValue});

  glyphvault::schema::hash32_t merkle_root(
      const std::vector<glyphvault::schema::glyph_id_t>& ids) const;
  std::optional<glyphvault::merkle::proof_t> inclusion_proof(
      const std::vector<glyphvault::schema::glyph_id_t>& ids,
      const glyphvault::schema::glyph_id_t& id) const;
  bool verify_inclusion(const glyphvault::schema::hash32_t& root,
                        const glyphvault::schema::glyph_id_t& id,
                        const glyphvault::merkle::proof_t& proof) const;

  /// Throws configuration_error when no chain client was supplied. A
  /// confirmed anchor logs ANCHORED for every recorded id in one batch.
  glyphvault::schema::anchor_result_t anchor(
      const std::vector<glyphvault::schema::glyph_id_t>& ids,
      std::string_view actor = kSystemActor,
      std::stop_token stop = {});

  glyphvault::schema::anchor_state anchor_status(
      const glyphvault::schema::hash32_t& root);

  /// Commits ledger rows for blobs written before a crash interrupted
  /// creation. Returns how many glyphs were replayed.
  std::size_t recover(std::string_view actor = kSystemActor);

  /// Downloads `cid` and records it with source "ipfs://<cid>".
  glyphvault::schema::glyph_t ingest(
      glyphvault::gateway::content_gateway& gateway,
      const std::string& cid,
      std::string_view actor = kSystemActor);

  /// Uploads the payload of `id`, logs PUBLISHED and returns the cid.
  std::string publish(const glyphvault::schema::glyph_id_t& id,
                      glyphvault::gateway::content_gateway& gateway,
                      std::string_view actor = kSystemActor);

  const std::filesystem::path& path() const noexcept { return path_; }
  std::string signer() const { return factory_.signer(); }
  glyphvault::schema::assurance_level assurance() const noexcept {
    return factory_.assurance();
  }

 private:
  static constexpr auto kLockStripes = std::size_t{64};

  std::mutex& lock_for(const glyphvault::schema::glyph_id_t& id) const;

  std::filesystem::path path_;
  glyphvault::glyph::factory factory_;
  encrypted_store store_;
  glyphvault::ledger::audit_ledger ledger_;
  std::unique_ptr<glyphvault::chain::anchor_client> chain_;
  mutable std::array<std::mutex, kLockStripes> locks_;
};

}  // namespace glyphvault::vault
