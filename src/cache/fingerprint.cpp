#include "lumen/cache/fingerprint.hpp"
#include "lumen/store/checksum.hpp"

#include <array>
#include <chrono>
#include <fstream>

namespace lumen::cache {

using core::error_code;

auto normalize_path(const std::filesystem::path& p) -> std::string {
  std::error_code ec;
  auto abs = std::filesystem::absolute(p, ec);
  if (ec) abs = p;
  auto s = abs.lexically_normal().generic_string();
  // "dir/" and "dir" must compare equal
  while (s.size() > 1 && s.back() == '/') s.pop_back();
  return s;
}

auto compute_fingerprint(const std::filesystem::path& file, FingerprintMode mode)
    -> std::expected<Fingerprint, core::error> {
  std::error_code ec;
  const auto st = std::filesystem::status(file, ec);
  if (ec || !std::filesystem::exists(st)) {
    return core::make_unexpected(error_code::not_found, "file missing: " + file.string(), "cache.fingerprint");
  }
  if (!std::filesystem::is_regular_file(st)) {
    return core::make_unexpected(error_code::invalid_argument, "not a regular file: " + file.string(), "cache.fingerprint");
  }

  Fingerprint fp{};
  fp.size_bytes = std::filesystem::file_size(file, ec);
  if (ec) {
    return core::make_unexpected(error_code::io_failed, "stat failed: " + ec.message(), "cache.fingerprint");
  }
  const auto mtime = std::filesystem::last_write_time(file, ec);
  if (ec) {
    return core::make_unexpected(error_code::io_failed, "mtime failed: " + ec.message(), "cache.fingerprint");
  }
  fp.mtime_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(mtime.time_since_epoch()).count();

  if (mode == FingerprintMode::content) {
    std::ifstream in(file, std::ios::binary);
    if (!in.good()) {
      return core::make_unexpected(error_code::io_failed, "open failed: " + file.string(), "cache.fingerprint");
    }
    std::array<char, 64 * 1024> buf{};
    std::uint32_t crc = 0;
    while (in) {
      in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
      const auto got = in.gcount();
      if (got <= 0) break;
      crc = store::crc32c_extend(crc, {reinterpret_cast<const std::uint8_t*>(buf.data()),
                                       static_cast<std::size_t>(got)});
    }
    if (in.bad()) {
      return core::make_unexpected(error_code::io_failed, "read failed: " + file.string(), "cache.fingerprint");
    }
    fp.content_crc = crc;
  }
  return fp;
}

} // namespace lumen::cache
