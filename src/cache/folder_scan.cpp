#include "lumen/cache/folder_scan.hpp"
#include "lumen/cache/fingerprint.hpp"
#include "lumen/core/platform_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace lumen::cache {

using core::error_code;

auto is_supported_image(const std::filesystem::path& p, const ScanOptions& opts) -> bool {
  std::string ext = p.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if (ext.empty()) return false;
  return std::find(opts.extensions.begin(), opts.extensions.end(), ext) != opts.extensions.end();
}

auto path_under(std::string_view path, std::string_view folder) noexcept -> bool {
  if (folder.empty()) return false;
  if (folder == "/") return !path.empty() && path.front() == '/';
  if (path.size() < folder.size() || path.compare(0, folder.size(), folder) != 0) return false;
  return path.size() == folder.size() || path[folder.size()] == '/';
}

auto scan_folders(std::span<const std::filesystem::path> folders, const ScanOptions& opts)
    -> std::expected<std::vector<std::string>, core::error> {
  namespace fs = std::filesystem;
  const bool dbg = opts.verbose || core::debug_enabled();

  std::vector<std::string> out;
  for (const auto& folder : folders) {
    std::error_code ec;
    if (!fs::is_directory(folder, ec)) {
      if (dbg) std::cerr << "[lumen][scan] skipping missing folder " << folder << std::endl;
      continue;
    }

    auto iter_opts = fs::directory_options::skip_permission_denied;
    if (opts.follow_symlinks) iter_opts |= fs::directory_options::follow_directory_symlink;

    fs::recursive_directory_iterator it(folder, iter_opts, ec);
    if (ec) {
      return core::make_unexpected(error_code::io_failed,
          "cannot open folder " + folder.string() + ": " + ec.message(), "cache.scan");
    }
    const fs::recursive_directory_iterator end;
    std::size_t found = 0;
    while (it != end) {
      const auto& entry = *it;
      std::error_code sec;
      if (entry.is_regular_file(sec) && !sec && is_supported_image(entry.path(), opts)) {
        out.push_back(normalize_path(entry.path()));
        ++found;
      }
      it.increment(ec);
      if (ec) {
        // A partial listing would let prune drop live records.
        return core::make_unexpected(error_code::io_failed,
            "walk failed under " + folder.string() + ": " + ec.message(), "cache.scan");
      }
    }
    if (dbg) std::cerr << "[lumen][scan] " << folder << ": " << found << " images" << std::endl;
  }

  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

} // namespace lumen::cache
