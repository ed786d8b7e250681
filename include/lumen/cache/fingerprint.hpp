#pragma once

/** \file fingerprint.hpp
 *  \brief File change detection and canonical path spelling for cache keys.
 */

#include <expected>
#include <filesystem>
#include <string>

#include "lumen/config.hpp"
#include "lumen/error.hpp"
#include "lumen/store/record.hpp"

namespace lumen::cache {

/** \brief Absolute, lexically normal, generic-separator spelling used as the record path. */
auto normalize_path(const std::filesystem::path& p) -> std::string;

/**
 * \brief Fingerprint a regular file.
 * \return not_found if the file is gone, io_failed on stat/read errors.
 * In content mode the whole file is read and CRC32C'd.
 */
auto compute_fingerprint(const std::filesystem::path& file, FingerprintMode mode)
    -> std::expected<Fingerprint, core::error>;

} // namespace lumen::cache
