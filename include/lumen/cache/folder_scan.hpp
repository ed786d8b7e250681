#pragma once

/** \file folder_scan.hpp
 *  \brief Recursive enumeration of image files under a folder set.
 */

#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "lumen/error.hpp"

namespace lumen::cache {

struct ScanOptions {
  /** lower-case extensions including the dot */
  std::vector<std::string> extensions{".jpg", ".jpeg", ".png", ".gif", ".bmp", ".webp"};
  bool follow_symlinks{false};
  bool verbose{false};
};

/** \brief Case-insensitive extension check against opts.extensions. */
auto is_supported_image(const std::filesystem::path& p, const ScanOptions& opts) -> bool;

/**
 * \brief Walk every folder recursively and collect supported image files.
 * \return normalized paths, ascending and unique (overlapping folders collapse).
 *
 * A folder that does not exist is skipped. A folder that exists but cannot be opened
 * is io_failed, so callers never mistake an unreadable folder for an empty one.
 */
auto scan_folders(std::span<const std::filesystem::path> folders, const ScanOptions& opts = {})
    -> std::expected<std::vector<std::string>, core::error>;

/** \brief True if path lies at or below folder (both normalized spellings). */
auto path_under(std::string_view path, std::string_view folder) noexcept -> bool;

} // namespace lumen::cache
