#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes grouped by thousands for programmatic handling.
 * - Human-readable message and originating component for diagnostics.
 *
 * Named conditions used throughout the library:
 * - CorruptStoreError      -> data_integrity
 * - FatalOrchestratorError -> unavailable
 * - InvalidQueryError      -> invalid_argument
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace lumen::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  config_invalid = 2001,
  data_integrity = 3001,
  decode_failed = 3002,
  precondition_failed = 4001,
  not_found = 6001,
  unavailable = 7001,
  provider_failed = 7002,
  cancelled = 8001,
  internal = 9001,
  invalid_argument = 9002,
  unsupported = 9005,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "cache.commit" */
};

constexpr std::string_view to_string(error_code ec) noexcept {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::config_invalid: return "config_invalid";
    case error_code::data_integrity: return "data_integrity";
    case error_code::decode_failed: return "decode_failed";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::not_found: return "not_found";
    case error_code::unavailable: return "unavailable";
    case error_code::provider_failed: return "provider_failed";
    case error_code::cancelled: return "cancelled";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::unsupported: return "unsupported";
  }
  return "unknown";
}

/** \brief Shorthand for building an unexpected error value. */
inline auto make_unexpected(error_code code, std::string message, std::string component)
    -> std::unexpected<error> {
  return std::unexpected(error{code, std::move(message), std::move(component)});
}

} // namespace lumen::core
