#pragma once

/**
 * \file error.hpp
 * \brief Status taxonomy for fallible library operations, used with std::expected.
 *
 * Design:
 * - Stable numeric codes for programmatic handling.
 * - Human-readable message and originating component for diagnostics.
 *
 * These describe failures of triage itself (case-file IO, malformed
 * configuration). Application errors that get classified are triage::error_id.
 */

#include <cstdint>
#include <expected>
#include <string>

namespace triage::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  config_invalid = 2001,
  internal = 9001,
  invalid_argument = 9002,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "triage.casefile" */
};

} // namespace triage::core
