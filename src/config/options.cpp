#include <glyphvault/common/error.hpp>
#include <glyphvault/config/options.hpp>

#include <openssl/crypto.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>

namespace glyphvault::config {

namespace {

constexpr auto kDefaultVaultPath = "glyph_vault";
constexpr auto kDefaultActor = "cli";

std::string read_secret_file(const std::string& path, const std::string& what) {
  auto in = std::ifstream{path, std::ios::binary};
  if (!in) {
    throw glyphvault::configuration_error("cannot read " + what + " file " +
                                          path);
  }
  auto text = std::string{std::istreambuf_iterator<char>{in},
                          std::istreambuf_iterator<char>{}};
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r' ||
                           text.back() == ' ' || text.back() == '\t')) {
    text.pop_back();
  }
  return text;
}

}  // namespace

options parse(const int argc, const char* const argv[]) {
  auto opts = options{};
  auto vault_path = std::string{};
  auto source_filter = std::string{};
  auto chain_id = uint64_t{};
  auto gas_price = uint64_t{};

  auto general = boost::program_options::options_description{"General"};
  general.add_options()("help,h", "Show the help message")(
      "config,c", boost::program_options::value<std::string>(),
      "INI-style file supplying any option not given on the command line")(
      "log-file", boost::program_options::value<std::string>(&opts.log_file),
      "Also write logs to this file")("verbose,v", "Enable verbose output");

  auto vault_options = boost::program_options::options_description{"Vault"};
  vault_options.add_options()(
      "vault,p",
      boost::program_options::value<std::string>(&vault_path)
          ->default_value(kDefaultVaultPath),
      "Vault directory")(
      "passphrase-file",
      boost::program_options::value<std::string>(&opts.passphrase_file),
      "File holding the vault passphrase")(
      "passphrase-env",
      boost::program_options::value<std::string>(&opts.passphrase_env),
      "Environment variable holding the vault passphrase")(
      "signing-key-file",
      boost::program_options::value<std::string>(&opts.signing_key_file),
      "File holding a hex secp256k1 private key")(
      "server-attestation",
      boost::program_options::bool_switch(&opts.server_attestation),
      "Sign with a server attestation when no key is configured")(
      "kdf-iterations",
      boost::program_options::value<uint32_t>(&opts.kdf_iterations)
          ->default_value(glyphvault::vault::kDefaultKdfIterations),
      "PBKDF2 iterations for a new vault")(
      "source,s", boost::program_options::value<std::string>(&opts.source),
      "Origin recorded with a new glyph")(
      "actor,a",
      boost::program_options::value<std::string>(&opts.actor)
          ->default_value(kDefaultActor),
      "Actor recorded in audit entries")(
      "source-filter",
      boost::program_options::value<std::string>(&source_filter),
      "Only list glyphs from this source")(
      "limit",
      boost::program_options::value<std::size_t>(&opts.limit)
          ->default_value(glyphvault::vault::kDefaultListLimit),
      "Maximum glyphs to list")(
      "offset", boost::program_options::value<std::size_t>(&opts.offset),
      "Glyphs to skip when listing")(
      "metadata", boost::program_options::value<std::string>(&opts.metadata),
      "JSON object attached to a logged action");

  auto chain_options = boost::program_options::options_description{"Chain"};
  chain_options.add_options()(
      "rpc-url", boost::program_options::value<std::string>(&opts.rpc_url),
      "JSON-RPC endpoint of the EVM node")(
      "contract", boost::program_options::value<std::string>(&opts.contract),
      "Anchoring contract address")(
      "chain-id", boost::program_options::value<uint64_t>(&chain_id),
      "EIP-155 chain id (queried from the node when omitted)")(
      "gas-price", boost::program_options::value<uint64_t>(&gas_price),
      "Gas price in wei (queried from the node when omitted)")(
      "gas-limit",
      boost::program_options::value<uint64_t>(&opts.gas_limit)
          ->default_value(glyphvault::chain::kDefaultGasLimit),
      "Gas limit for anchor transactions")(
      "confirmation-timeout",
      boost::program_options::value<uint64_t>(
          &opts.confirmation_timeout_seconds)
          ->default_value(120),
      "Seconds to wait for a receipt")(
      "rpc-retries",
      boost::program_options::value<uint32_t>(&opts.rpc_retries)
          ->default_value(3),
      "Retries for read calls after a transport failure");

  auto hidden = boost::program_options::options_description{};
  hidden.add_options()(
      "command", boost::program_options::value<std::string>(&opts.command))(
      "args",
      boost::program_options::value<std::vector<std::string>>(&opts.arguments));

  auto positional = boost::program_options::positional_options_description{};
  positional.add("command", 1).add("args", -1);

  auto command_line = boost::program_options::options_description{};
  command_line.add(general).add(vault_options).add(chain_options).add(hidden);
  auto file_options = boost::program_options::options_description{};
  file_options.add(vault_options).add(chain_options);
  auto visible = boost::program_options::options_description{
      "Usage: glyphvault [options] <command> [args...]\n\n"
      "Commands:\n"
      "  create <json file|->          record a payload\n"
      "  get <id>                      retrieve a glyph\n"
      "  proof <id>                    provenance report\n"
      "  list                          newest glyphs first\n"
      "  stats                         vault statistics\n"
      "  log <id> <action>             append an audit entry\n"
      "  recover                       replay orphaned payloads\n"
      "  root <id>...                  Merkle root of ids\n"
      "  merkle-proof <id> <ids>...    inclusion proof for id\n"
      "  verify-proof <root> <id> [sibling]...\n"
      "  anchor <id>...                anchor the ids on chain\n"
      "  status <root>                 on-chain anchor state\n"};
  visible.add(general).add(vault_options).add(chain_options);

  auto vm = boost::program_options::variables_map{};
  try {
    boost::program_options::store(
        boost::program_options::command_line_parser(argc, argv)
            .options(command_line)
            .positional(positional)
            .run(),
        vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto in = std::ifstream{path};
      if (!in) {
        throw glyphvault::configuration_error("cannot read config file " +
                                              path);
      }
      boost::program_options::store(
          boost::program_options::parse_config_file(in, file_options), vm);
    }
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& e) {
    throw glyphvault::configuration_error(e.what());
  }

  auto usage = std::ostringstream{};
  usage << visible;
  opts.usage = usage.str();
  opts.help = vm.contains("help");
  opts.verbose = vm.contains("verbose");
  opts.vault_path = vault_path;
  if (vm.contains("source-filter")) {
    opts.source_filter = source_filter;
  }
  if (vm.contains("chain-id")) {
    opts.chain_id = chain_id;
  }
  if (vm.contains("gas-price")) {
    opts.gas_price = gas_price;
  }
  return opts;
}

std::string read_passphrase(const options& opts) {
  if (!opts.passphrase_file.empty()) {
    auto passphrase = read_secret_file(opts.passphrase_file, "passphrase");
    if (passphrase.empty()) {
      throw glyphvault::configuration_error("passphrase file " +
                                            opts.passphrase_file +
                                            " is empty");
    }
    return passphrase;
  }
  if (!opts.passphrase_env.empty()) {
    const auto* value = std::getenv(opts.passphrase_env.c_str());
    if (value == nullptr || *value == '\0') {
      throw glyphvault::configuration_error("environment variable " +
                                            opts.passphrase_env +
                                            " holds no passphrase");
    }
    return std::string{value};
  }
  throw glyphvault::configuration_error(
      "no vault passphrase configured; use --passphrase-file or "
      "--passphrase-env");
}

std::optional<glyphvault::crypto::signing_key> read_signing_key(
    const options& opts) {
  if (opts.signing_key_file.empty()) {
    return std::nullopt;
  }
  auto text = read_secret_file(opts.signing_key_file, "signing key");
  auto key = glyphvault::crypto::signing_key::from_hex(text);
  OPENSSL_cleanse(text.data(), text.size());
  if (!key.has_value()) {
    throw glyphvault::configuration_error(
        "signing key file " + opts.signing_key_file +
        " does not hold a valid secp256k1 private key");
  }
  return key;
}

glyphvault::glyph::signing_identity make_identity(const options& opts) {
  auto key = read_signing_key(opts);
  if (key.has_value()) {
    return glyphvault::glyph::local_key{.key = *key};
  }
  if (opts.server_attestation) {
    spdlog::warn(
        "Signing with server attestation; glyphs carry no key signature");
    return glyphvault::glyph::server_attestation{};
  }
  throw glyphvault::configuration_error(
      "no signing identity configured; use --signing-key-file or pass "
      "--server-attestation explicitly");
}

glyphvault::vault::vault_config make_vault_config(const options& opts) {
  return glyphvault::vault::vault_config{
      .path = opts.vault_path,
      .passphrase = read_passphrase(opts),
      .identity = make_identity(opts),
      .kdf_iterations = opts.kdf_iterations};
}

glyphvault::chain::anchor_client_config make_chain_config(
    const options& opts) {
  auto config = glyphvault::chain::anchor_client_config{};
  config.rpc_url = opts.rpc_url;
  if (!opts.contract.empty()) {
    config.contract = glyphvault::crypto::try_parse_address(opts.contract);
    if (!config.contract.has_value()) {
      throw glyphvault::configuration_error("invalid contract address " +
                                            opts.contract);
    }
  }
  config.signer = read_signing_key(opts);
  config.chain_id = opts.chain_id;
  config.gas_price = opts.gas_price;
  config.gas_limit = opts.gas_limit;
  config.confirmation_timeout =
      std::chrono::seconds{opts.confirmation_timeout_seconds};
  config.max_retries = opts.rpc_retries;
  return config;
}

std::unique_ptr<glyphvault::chain::anchor_client> make_chain_client(
    const options& opts) {
  if (opts.rpc_url.empty()) {
    return nullptr;
  }
  return glyphvault::chain::make_http_anchor_client(make_chain_config(opts));
}

}  // namespace glyphvault::config
