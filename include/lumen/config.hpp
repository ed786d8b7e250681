#pragma once

/** \file config.hpp
 *  \brief Cache configuration and its environment overrides.
 *
 * Environment:
 *   LUMEN_CACHE_DIR    cache directory (else $XDG_CACHE_HOME/lumen, $HOME/.cache/lumen, ./cache)
 *   LUMEN_FINGERPRINT  "metadata" (default) or "content"
 *   LUMEN_NO_FSYNC     skip fsync on save when set
 *   LUMEN_DEBUG        enable diagnostics on std::cerr
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string_view>

#include "lumen/error.hpp"

namespace lumen {

/**
 * \brief How file fingerprints are computed.
 *
 * metadata: size + mtime only. Cheap, but a rewrite that keeps both is not detected.
 * content:  additionally CRC32C of the bytes. Every diff reads every file.
 */
enum class FingerprintMode : std::uint8_t { metadata, content };

auto parse_fingerprint_mode(std::string_view text) -> std::expected<FingerprintMode, core::error>;

struct CacheConfig {
  std::filesystem::path cache_dir;                       /**< holds one store file per model */
  FingerprintMode fingerprint{FingerprintMode::metadata};
  bool sync{true};                                       /**< fsync store files on save */
  bool verbose{false};                                   /**< diagnostics on std::cerr */
};

/** \brief Resolve the default cache directory from the environment. */
auto default_cache_dir() -> std::filesystem::path;

/** \brief Defaults with environment overrides applied; malformed values are ignored. */
auto cache_config_from_env() -> CacheConfig;

} // namespace lumen
