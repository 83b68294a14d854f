#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling by the API/CLI layer.
 * - Human-readable message and originating component for diagnostics.
 * - Compile-stage codes (unknown_column, unsupported_operator, malformed_operand)
 *   are always raised before any engine call.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace grainguard::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  config_invalid = 2001,
  dataset_not_found = 3001,
  schema_unavailable = 3002,
  unknown_column = 4001,
  unsupported_operator = 4002,
  malformed_operand = 4003,
  precondition_failed = 4101,
  analysis_blocked = 4201,
  execution_failed = 5001,
  internal = 9001,
  invalid_argument = 9002,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "filter.compile" */
};

/** \brief Short stable name of a code, e.g. "unknown_column". */
auto to_string(error_code code) -> std::string_view;

inline auto make_unexpected(error_code code, std::string message, std::string component)
    -> std::unexpected<error> {
  return std::unexpected(error{code, std::move(message), std::move(component)});
}

} // namespace grainguard::core
