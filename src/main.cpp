#include <csignal>
#include <json/reader.h>
#include <json/writer.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <glyphvault/common/error.hpp>
#include <glyphvault/config/options.hpp>
#include <glyphvault/content/hasher.hpp>
#include <glyphvault/merkle/tree.hpp>
#include <glyphvault/schema/json.hpp>
#include <glyphvault/vault/vault.hpp>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stop_token>
#include <string>
#include <thread>

using namespace glyphvault::schema;

namespace {

constexpr auto kUsageExit = 2;
constexpr auto kErrorExitBase = 10;

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

void setup_logging(const glyphvault::config::options& opts) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{};
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!opts.log_file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        opts.log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "glyphvault", sinks.begin(), sinks.end(), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(opts.verbose ? spdlog::level::debug : spdlog::level::info);
}

void print(const Json::Value& value) {
  auto builder = Json::StreamWriterBuilder{};
  builder["indentation"] = "  ";
  builder["emitUTF8"] = true;
  std::cout << Json::writeString(builder, value) << std::endl;
}

void require_arguments(const glyphvault::config::options& opts,
                       const std::size_t count,
                       const std::string& usage) {
  if (opts.arguments.size() < count) {
    throw std::invalid_argument("usage: glyphvault " + opts.command + " " +
                                usage);
  }
}

glyph_id_t parse_id(const std::string& text) {
  auto id = try_make_hash32(text);
  if (!id.has_value()) {
    throw std::invalid_argument("not a 32-byte hex value: " + text);
  }
  return *id;
}

std::vector<glyph_id_t> parse_ids(const std::vector<std::string>& texts,
                                  const std::size_t first) {
  auto ids = std::vector<glyph_id_t>{};
  for (auto i = first; i < texts.size(); ++i) {
    ids.push_back(parse_id(texts[i]));
  }
  return ids;
}

Json::Value read_payload(const std::string& path) {
  auto text = std::string{};
  if (path == "-") {
    text.assign(std::istreambuf_iterator<char>{std::cin},
                std::istreambuf_iterator<char>{});
  } else {
    auto in = std::ifstream{path, std::ios::binary};
    if (!in) {
      throw std::invalid_argument("cannot read payload file " + path);
    }
    text.assign(std::istreambuf_iterator<char>{in},
                std::istreambuf_iterator<char>{});
  }
  return glyphvault::content::parse(text);
}

Json::Value to_json(const glyphvault::merkle::proof_t& proof) {
  auto siblings = Json::Value{Json::arrayValue};
  for (const auto& sibling : proof) {
    siblings.append(to_prefixed_hex(sibling));
  }
  return siblings;
}

// Cancels `source` once SIGINT arrives. Stops watching when `watcher_stop`
// is requested by the jthread destructor.
std::jthread watch_interrupts(std::stop_source& source) {
  return std::jthread{[&source](std::stop_token watcher_stop) {
    while (!watcher_stop.stop_requested()) {
      if (shutdown_requested()) {
        spdlog::warn("Interrupt received; cancelling");
        source.request_stop();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }};
}

int run_offline(const glyphvault::config::options& opts) {
  const auto& args = opts.arguments;
  if (opts.command == "root") {
    require_arguments(opts, 1, "<id>...");
    auto root = glyphvault::merkle::root(parse_ids(args, 0));
    print(Json::Value{to_prefixed_hex(root)});
    return 0;
  }
  if (opts.command == "merkle-proof") {
    require_arguments(opts, 2, "<id> <ids>...");
    auto target = parse_id(args[0]);
    auto ids = parse_ids(args, 1);
    auto proof = glyphvault::merkle::proof(ids, target);
    if (!proof.has_value()) {
      spdlog::error("{} is not among the given ids", args[0]);
      return 1;
    }
    auto out = Json::Value{Json::objectValue};
    out["root"] = to_prefixed_hex(glyphvault::merkle::root(ids));
    out["glyph_id"] = to_prefixed_hex(target);
    out["proof"] = to_json(*proof);
    print(out);
    return 0;
  }
  // verify-proof
  require_arguments(opts, 2, "<root> <id> [sibling]...");
  auto root = parse_id(args[0]);
  auto id = parse_id(args[1]);
  auto valid =
      glyphvault::merkle::verify(root, id, parse_ids(args, 2));
  print(Json::Value{valid});
  return valid ? 0 : 1;
}

int run_status(const glyphvault::config::options& opts) {
  require_arguments(opts, 1, "<root>");
  auto client = glyphvault::config::make_chain_client(opts);
  if (!client) {
    throw glyphvault::configuration_error("status requires --rpc-url");
  }
  print(to_json(client->is_anchored(parse_id(opts.arguments[0]))));
  return 0;
}

int run_vault(const glyphvault::config::options& opts) {
  const auto& args = opts.arguments;
  auto chain_client = opts.command == "anchor"
                          ? glyphvault::config::make_chain_client(opts)
                          : nullptr;
  auto vault = glyphvault::vault::vault{
      glyphvault::config::make_vault_config(opts), std::move(chain_client)};

  if (opts.command == "create") {
    require_arguments(opts, 1, "<json file|->");
    if (opts.source.empty()) {
      throw std::invalid_argument("create requires --source");
    }
    auto glyph = vault.create(read_payload(args[0]), opts.source, opts.actor);
    print(to_json(glyph));
    return 0;
  }
  if (opts.command == "get") {
    require_arguments(opts, 1, "<id>");
    print(to_json(vault.retrieve(parse_id(args[0]))));
    return 0;
  }
  if (opts.command == "proof") {
    require_arguments(opts, 1, "<id>");
    print(to_json(vault.proof(parse_id(args[0]))));
    return 0;
  }
  if (opts.command == "list") {
    auto out = Json::Value{Json::arrayValue};
    for (const auto& summary :
         vault.list(opts.source_filter, opts.limit, opts.offset)) {
      out.append(to_json(summary));
    }
    print(out);
    return 0;
  }
  if (opts.command == "stats") {
    print(to_json(vault.stats()));
    return 0;
  }
  if (opts.command == "log") {
    require_arguments(opts, 2, "<id> <action>");
    auto metadata = Json::Value{Json::objectValue};
    if (!opts.metadata.empty()) {
      auto parsed = try_parse_json(opts.metadata);
      if (!parsed.has_value() || !parsed->isObject()) {
        throw std::invalid_argument("--metadata must be a JSON object");
      }
      metadata = *parsed;
    }
    print(to_json(
        vault.log_action(parse_id(args[0]), args[1], opts.actor, metadata)));
    return 0;
  }
  if (opts.command == "recover") {
    auto out = Json::Value{Json::objectValue};
    out["recovered"] = Json::UInt64{vault.recover(opts.actor)};
    print(out);
    return 0;
  }
  // anchor
  require_arguments(opts, 1, "<id>...");
  auto source = std::stop_source{};
  auto watcher = watch_interrupts(source);
  auto result =
      vault.anchor(parse_ids(args, 0), opts.actor, source.get_token());
  print(to_json(result));
  return 0;
}

int run(const glyphvault::config::options& opts) {
  if (opts.command == "root" || opts.command == "merkle-proof" ||
      opts.command == "verify-proof") {
    return run_offline(opts);
  }
  if (opts.command == "status") {
    return run_status(opts);
  }
  if (opts.command == "create" || opts.command == "get" ||
      opts.command == "proof" || opts.command == "list" ||
      opts.command == "stats" || opts.command == "log" ||
      opts.command == "recover" || opts.command == "anchor") {
    return run_vault(opts);
  }
  throw std::invalid_argument("unknown command '" + opts.command + "'");
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);

  auto opts = glyphvault::config::options{};
  try {
    opts = glyphvault::config::parse(argc, argv);
  } catch (const glyphvault::configuration_error& e) {
    std::cerr << e.what() << std::endl;
    return kUsageExit;
  }

  if (opts.help || opts.command.empty()) {
    std::cout << opts.usage << std::endl;
    return opts.help ? 0 : kUsageExit;
  }

  setup_logging(opts);

  auto status = 0;
  try {
    status = run(opts);
  } catch (const glyphvault::chain_error& e) {
    spdlog::error("{} error: {}", glyphvault::to_string(e.code()), e.what());
    if (!e.tx_hash().empty()) {
      spdlog::error("transaction {}", e.tx_hash());
    }
    if (!e.receipt().empty()) {
      spdlog::error("receipt {}", e.receipt());
    }
    status = kErrorExitBase + static_cast<int>(e.code());
  } catch (const glyphvault::error& e) {
    spdlog::error("{} error: {}", glyphvault::to_string(e.code()), e.what());
    status = kErrorExitBase + static_cast<int>(e.code());
  } catch (const std::invalid_argument& e) {
    spdlog::error("{}", e.what());
    status = kUsageExit;
  }

  spdlog::shutdown();
  return status;
}
