#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling.
 * - Human-readable message and originating component for diagnostics.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace strata::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  config_invalid = 2001,
  precondition_failed = 4001,
  not_found = 6001,
  internal = 9001,
  invalid_argument = 9002,
  not_initialized = 9003,
  dimension_mismatch = 9006,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "index.hnsw" */
};

/** \brief Stable lowercase name of a code, for log lines. */
constexpr std::string_view to_string(error_code ec) noexcept {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::config_invalid: return "config_invalid";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::not_found: return "not_found";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::not_initialized: return "not_initialized";
    case error_code::dimension_mismatch: return "dimension_mismatch";
  }
  return "unknown";
}

} // namespace strata::core
