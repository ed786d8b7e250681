#pragma once

/** \file store_file.hpp
 *  \brief Whole-file load/save of one model's vector records.
 *
 * Layout: see record_codec.hpp. One file per model, named "<slug>.lstore".
 *
 * Atomic, durable save (POSIX):
 * - Write contents to a temporary sibling file (<name>.tmp) in the same directory
 * - fsync(tmp) when WriteOptions::sync is set
 * - std::filesystem::rename(tmp, dst) (rename(2), replaces if exists)
 * - Best-effort fsync of the parent directory
 * - On failure, the tmp file is removed and io_failed is returned. The destination is
 *   never truncated or written in place.
 *
 * Load tolerance:
 * - missing file                           -> not_found
 * - bad header / version / model mismatch  -> data_integrity (corrupt store)
 * - bad individual record                  -> skipped, counted in StoreReadStats::discarded
 * - damaged frame (bad magic, length, crc)  -> scan resumes at the next record magic; each
 *                                             damaged region counts as one discard
 * - fewer frames recovered than the header count -> logged to std::cerr
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <vector>

#include "lumen/error.hpp"
#include "lumen/model.hpp"
#include "lumen/store/record.hpp"

namespace lumen::store {

struct StoreReadStats {
  std::size_t loaded{};       /**< records accepted */
  std::size_t discarded{};    /**< damaged regions skipped (a rejected frame or unframeable bytes) */
  std::uint64_t skipped_bytes{};  /**< bytes passed over while resynchronizing */
  std::size_t duplicates{};   /**< earlier frames superseded by a later one for the same path */
  std::uint64_t file_bytes{};
};

struct StoreContents {
  std::vector<EmbeddingRecord> records;   /**< ascending path, unique paths */
  StoreReadStats stats;
};

struct WriteOptions {
  bool sync{true};   /**< fsync tmp file and parent directory */
};

/** \brief Store file path for a model under cache_dir. */
auto store_path(const std::filesystem::path& cache_dir, ModelId model) -> std::filesystem::path;

auto read_store(const std::filesystem::path& file, ModelId model)
    -> std::expected<StoreContents, core::error>;

auto write_store(const std::filesystem::path& file, ModelId model,
                 std::span<const EmbeddingRecord> records, const WriteOptions& opts = {})
    -> std::expected<void, core::error>;

} // namespace lumen::store
