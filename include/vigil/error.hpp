#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling by the API layer.
 * - Human-readable message and originating component for diagnostics.
 * - Recoverable codes degrade a single tier; fatal codes abort the request.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace vigil::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  config_invalid = 2001,
  malformed_input = 4001,
  cache_error = 5001,
  not_found = 6001,
  backend_unavailable = 7001,
  deadline_exceeded = 7002,
  cancelled = 8001,
  internal = 9001,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "tier.vector" */
};

/** \brief Whether an error aborts the whole screening request. */
constexpr auto is_fatal(error_code ec) noexcept -> bool {
  switch (ec) {
    case error_code::malformed_input:
    case error_code::internal:
    case error_code::cancelled:
    case error_code::config_invalid:
      return true;
    default:
      return false;
  }
}

/** \brief Short stable name, used in reason codes and logs. */
constexpr auto to_string(error_code ec) noexcept -> std::string_view {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::config_invalid: return "config_invalid";
    case error_code::malformed_input: return "malformed_input";
    case error_code::cache_error: return "cache_error";
    case error_code::not_found: return "not_found";
    case error_code::backend_unavailable: return "backend_unavailable";
    case error_code::deadline_exceeded: return "deadline_exceeded";
    case error_code::cancelled: return "cancelled";
    case error_code::internal: return "internal";
  }
  return "internal";
}

} // namespace vigil::core
