#include "lumen/config.hpp"
#include "lumen/core/platform_utils.hpp"

#include <iostream>
#include <string>

namespace lumen {

auto parse_fingerprint_mode(std::string_view text) -> std::expected<FingerprintMode, core::error> {
  if (text == "metadata" || text == "mtime") return FingerprintMode::metadata;
  if (text == "content" || text == "crc") return FingerprintMode::content;
  return core::make_unexpected(core::error_code::config_invalid,
      "unknown fingerprint mode \"" + std::string(text) + "\"", "config");
}

auto default_cache_dir() -> std::filesystem::path {
  if (auto v = core::safe_getenv("LUMEN_CACHE_DIR"); v && !v->empty()) return *v;
  if (auto v = core::safe_getenv("XDG_CACHE_HOME"); v && !v->empty()) {
    return std::filesystem::path(*v) / "lumen";
  }
  if (auto v = core::safe_getenv("HOME"); v && !v->empty()) {
    return std::filesystem::path(*v) / ".cache" / "lumen";
  }
  return std::filesystem::path("cache");
}

auto cache_config_from_env() -> CacheConfig {
  CacheConfig cfg{};
  cfg.cache_dir = default_cache_dir();
  cfg.verbose = core::debug_enabled();
  if (auto v = core::safe_getenv("LUMEN_FINGERPRINT"); v && !v->empty()) {
    if (auto m = parse_fingerprint_mode(*v)) {
      cfg.fingerprint = *m;
    } else if (cfg.verbose) {
      std::cerr << "[lumen][config] ignoring LUMEN_FINGERPRINT=" << *v << std::endl;
    }
  }
  if (core::env_flag("LUMEN_NO_FSYNC")) cfg.sync = false;
  return cfg;
}

} // namespace lumen
