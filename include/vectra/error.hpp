#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling.
 * - Human-readable message and originating component for diagnostics.
 * - "No results" is never an error; callers receive an empty std::optional.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace vectra::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  config_invalid = 2001,
  data_integrity = 3001,
  precondition_failed = 4001,
  dimension_mismatch = 4002,   /**< vector length disagrees with collection schema */
  validation_failed = 4003,    /**< malformed input, rejected before any write */
  not_found = 6001,
  transient_write = 7001,      /**< a batch write failed; earlier batches stay committed */
  internal = 9001,
  invalid_argument = 9002,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "index.dense" */
};

/** \brief Short stable name of an error code, e.g. "not_found". */
auto to_string(error_code code) noexcept -> std::string_view;

/** \brief Convenience for the common `return std::unexpected(error{...})` shape. */
inline auto make_unexpected(error_code code, std::string message, std::string component)
    -> std::unexpected<error> {
  return std::unexpected(error{code, std::move(message), std::move(component)});
}

} // namespace vectra::core
