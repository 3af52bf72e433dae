#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling by the decision layer.
 * - Human-readable message and originating component for diagnostics.
 * - Evaluation never produces an error; only analysis, compilation, the
 *   operator registry and cache configuration do.
 */

#include <cstdint>
#include <expected>
#include <string>

namespace verdict::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  config_invalid = 2001,
  precondition_failed = 4001,
  not_eligible = 4002,
  not_found = 6001,
  internal = 9001,
  invalid_argument = 9002,
  unsupported = 9005,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "codegen.scalar" */
};

/** \brief Stable lowercase name of an error code ("not_eligible"). */
auto to_string(error_code code) -> const char*;

} // namespace verdict::core
