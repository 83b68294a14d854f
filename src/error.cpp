#include "grainguard/error.hpp"

namespace grainguard::core {

auto to_string(error_code code) -> std::string_view {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::config_invalid: return "config_invalid";
    case error_code::dataset_not_found: return "dataset_not_found";
    case error_code::schema_unavailable: return "schema_unavailable";
    case error_code::unknown_column: return "unknown_column";
    case error_code::unsupported_operator: return "unsupported_operator";
    case error_code::malformed_operand: return "malformed_operand";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::analysis_blocked: return "analysis_blocked";
    case error_code::execution_failed: return "execution_failed";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
  }
  return "internal";
}

} // namespace grainguard::core
