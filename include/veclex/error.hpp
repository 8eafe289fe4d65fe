#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling.
 * - Human-readable message and the originating stage, e.g. "ingest.embed".
 * - Collaborator failures travel through unchanged; only their component
 *   string identifies where they surfaced.
 */

#include <cstdint>
#include <expected>
#include <string>

namespace veclex::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  io_eof = 1002,
  config_invalid = 2001,
  data_integrity = 3001,
  precondition_failed = 4001,
  not_found = 6001,
  unavailable = 7001,
  cancelled = 8001,
  internal = 9001,
  invalid_argument = 9002,
  out_of_range = 9004,
  unsupported = 9005,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< stage, e.g., "index.sparse" */
};

/** \brief Short code name used in diagnostics. */
constexpr const char* to_string(error_code ec) noexcept {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::io_eof: return "io_eof";
    case error_code::config_invalid: return "config_invalid";
    case error_code::data_integrity: return "data_integrity";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::not_found: return "not_found";
    case error_code::unavailable: return "unavailable";
    case error_code::cancelled: return "cancelled";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::out_of_range: return "out_of_range";
    case error_code::unsupported: return "unsupported";
  }
  return "internal";
}

} // namespace veclex::core
