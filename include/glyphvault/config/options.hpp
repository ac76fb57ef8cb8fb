#pragma once

#include <glyphvault/chain/anchor_client.hpp>
#include <glyphvault/glyph/factory.hpp>
#include <glyphvault/vault/vault.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace glyphvault::config {

/// Everything the command line (and an optional config file) can set.
/// Secrets are never given inline, only as a file or an environment
/// variable name.
struct options final {
  bool help{};
  std::string usage;

  std::string command;
  std::vector<std::string> arguments;

  std::filesystem::path vault_path;
  std::string passphrase_file;
  std::string passphrase_env;
  std::string signing_key_file;
  bool server_attestation{};
  uint32_t kdf_iterations{glyphvault::vault::kDefaultKdfIterations};

  std::string source;
  std::string actor;
  std::optional<std::string> source_filter;
  std::size_t limit{glyphvault::vault::kDefaultListLimit};
  std::size_t offset{};
  std::string metadata;

  std::string rpc_url;
  std::string contract;
  std::optional<uint64_t> chain_id;
  std::optional<uint64_t> gas_price;
  uint64_t gas_limit{glyphvault::chain::kDefaultGasLimit};
  uint64_t confirmation_timeout_seconds{120};
  uint32_t rpc_retries{3};

  std::string log_file;
  bool verbose{};
};

/// Parses argv, then the file named by --config for anything argv left
/// unset. Throws configuration_error on malformed input.
options parse(int argc, const char* const argv[]);

/// Passphrase from --passphrase-file or the variable named by
/// --passphrase-env. Throws configuration_error when neither yields one.
std::string read_passphrase(const options& opts);

/// Key from --signing-key-file, or std::nullopt when none is configured.
/// Throws configuration_error for an unreadable or invalid key.
std::optional<glyphvault::crypto::signing_key> read_signing_key(
    const options& opts);

/// A local key when one is configured, server attestation only when
/// --server-attestation was given. Throws configuration_error otherwise.
glyphvault::glyph::signing_identity make_identity(const options& opts);

glyphvault::vault::vault_config make_vault_config(const options& opts);

glyphvault::chain::anchor_client_config make_chain_config(
    const options& opts);

/// HTTP anchor client when --rpc-url is set, otherwise null.
std::unique_ptr<glyphvault::chain::anchor_client> make_chain_client(
    const options& opts);

}  // namespace glyphvault::config
