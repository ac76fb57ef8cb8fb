#include <glyphvault/common/error.hpp>

namespace glyphvault {

std::string_view to_string(const error_code code) {
  switch (code) {
    case error_code::configuration:
      return "configuration";
    case error_code::integrity:
      return "integrity";
    case error_code::not_found:
      return "not_found";
    case error_code::chain:
      return "chain";
    case error_code::storage:
      return "storage";
  }
  return "unknown";
}

}  // namespace glyphvault
