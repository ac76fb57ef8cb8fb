#pragma once

#include <json/value.h>
#include <string>

namespace glyphvault::gateway {

/// Content-addressed distributed store (IPFS-style) the vault can pull
/// payloads from and publish payloads to. Implementations live outside this
/// library and report failures by throwing.
class content_gateway {
 public:
  virtual ~content_gateway() = default;

  /// Fetch the JSON document stored under `cid`.
  virtual Json::Value download(const std::string& cid) = 0;

  /// Store a JSON document and return its content identifier.
  virtual std::string upload(const Json::Value& document) = 0;
};

}  // namespace glyphvault::gateway
