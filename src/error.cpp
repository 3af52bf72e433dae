#include "verdict/error.hpp"

namespace verdict::core {

auto to_string(error_code code) -> const char* {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::config_invalid: return "config_invalid";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::not_eligible: return "not_eligible";
    case error_code::not_found: return "not_found";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::unsupported: return "unsupported";
  }
  return "unknown";
}

} // namespace verdict::core
