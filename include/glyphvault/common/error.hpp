#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

// Failure taxonomy shared by every vault component. Expected negative
// outcomes (bad signature, bad proof) are reported as values, not errors.
namespace glyphvault {

enum class error_code : uint32_t {
  configuration = 1,
  integrity = 2,
  not_found = 3,
  chain = 4,
  storage = 5,
};

std::string_view to_string(error_code code);

class error : public std::runtime_error {
 public:
  error(error_code code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  error_code code() const noexcept { return code_; }

 private:
  error_code code_;
};

/// Missing or invalid setup (key material, contract address, passphrase).
/// Never retried automatically.
class configuration_error final : public error {
 public:
  explicit configuration_error(const std::string& message)
      : error(error_code::configuration, message) {}
};

/// Hash mismatch or authenticated decryption failure: the data existed but
/// is compromised, or the key is wrong.
class integrity_error final : public error {
 public:
  explicit integrity_error(const std::string& message)
      : error(error_code::integrity, message) {}
};

/// The glyph id was never recorded.
class not_found_error final : public error {
 public:
  explicit not_found_error(const std::string& message)
      : error(error_code::not_found, message) {}
};

/// Transaction failure, revert or confirmation timeout. Callers may retry
/// after re-checking the anchor status.
class chain_error final : public error {
 public:
  chain_error(const std::string& message,
              std::string tx_hash = {},
              std::string receipt = {})
      : error(error_code::chain, message),
        tx_hash_(std::move(tx_hash)),
        receipt_(std::move(receipt)) {}

  /// Hash of the submitted transaction, empty when nothing was submitted.
  const std::string& tx_hash() const noexcept { return tx_hash_; }

  /// Raw receipt JSON (or last RPC error) when one was observed.
  const std::string& receipt() const noexcept { return receipt_; }

 private:
  std::string tx_hash_;
  std::string receipt_;
};

/// RocksDB or filesystem I/O failure.
class storage_error final : public error {
 public:
  explicit storage_error(const std::string& message)
      : error(error_code::storage, message) {}
};

}  // namespace glyphvault
