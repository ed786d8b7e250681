#pragma once

/** \file cache_manager.hpp
 *  \brief Single source of truth for which images have valid embeddings.
 *
 * Thread-safety:
 * - load/diff/contains/stats may run concurrently with each other and with a writer.
 * - commit/prune/remove/clear serialize on an internal writer mutex.
 * - Readers copy the published snapshot pointer under a shared lock and are never
 *   blocked by store I/O of an in-progress commit; they see the old or the new
 *   snapshot, never a mix.
 *
 * Durability: every mutation rewrites the model's store file through an atomic
 * tmp + rename (see store_file.hpp) before the new snapshot is published, so a
 * published snapshot always matches a completed write.
 *
 * The active model is an explicit parameter on every call; snapshots for different
 * models are held separately.
 */

#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <span>
#include <vector>

#include "lumen/cache/folder_scan.hpp"
#include "lumen/cache/snapshot.hpp"
#include "lumen/config.hpp"
#include "lumen/error.hpp"
#include "lumen/model.hpp"
#include "lumen/store/record.hpp"

namespace lumen::cache {

/** \brief Images under a folder set that need (re)computation for one model. */
struct PendingSet {
    ModelId model{kDefaultModel};
    std::vector<ImageKey> keys;   /**< ascending path; fingerprint is the current one */
    std::size_t scanned{};        /**< image files found under the folder set */
    std::size_t fresh{};          /**< keys with no record at all */
    std::size_t stale{};          /**< keys whose record has another fingerprint */

    [[nodiscard]] auto size() const noexcept -> std::size_t { return keys.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return keys.empty(); }
};

struct CacheStats {
    ModelId model{kDefaultModel};
    std::size_t records{};
    std::uint32_t dim{};
    std::uint64_t store_bytes{};        /**< size of the store file, 0 if absent */
    std::size_t discarded_on_load{};    /**< corrupt records dropped when the store was read */
};

class CacheManager {
public:
    explicit CacheManager(CacheConfig config);
    ~CacheManager();

    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    [[nodiscard]] auto config() const noexcept -> const CacheConfig&;
    [[nodiscard]] auto store_file(ModelId model) const -> std::filesystem::path;

    /**
     * \brief Snapshot for a model, reading the store on first use.
     * A missing store is an empty snapshot. A corrupt store is data_integrity; the
     * caller should treat it as empty and trigger a full recompute.
     */
    auto load(ModelId model) -> std::expected<SnapshotPtr, core::error>;

    /**
     * \brief load(), but a corrupt store is moved aside to "<file>.corrupt" and an
     * empty snapshot is published instead of failing.
     */
    auto load_or_reset(ModelId model) -> std::expected<SnapshotPtr, core::error>;

    /**
     * \brief Keys under the folder set with no record or a different fingerprint.
     * O(files); never calls the embedding provider. Idempotent.
     */
    auto diff(std::span<const std::filesystem::path> folders, ModelId model)
        -> std::expected<PendingSet, core::error>;

    /**
     * \brief Merge records (replace by path+model), persist atomically, publish.
     * Records are validated first; one invalid record rejects the whole call with
     * invalid_argument or unsupported and nothing is written. Committing records that
     * are already stored unchanged performs no write.
     */
    auto commit(std::span<const EmbeddingRecord> records) -> std::expected<void, core::error>;

    /**
     * \brief Drop records whose file is not found under the folder set (or no longer
     * exists). \return number of records removed.
     */
    auto prune(std::span<const std::filesystem::path> folders, ModelId model)
        -> std::expected<std::size_t, core::error>;

    /** \brief Drop one record. \return true if it existed. */
    auto remove(const std::filesystem::path& file, ModelId model) -> std::expected<bool, core::error>;

    /** \brief Delete a model's store and publish an empty snapshot. */
    auto clear(ModelId model) -> std::expected<void, core::error>;

    /** \brief clear() for every supported model. */
    auto clear_all() -> std::expected<void, core::error>;

    [[nodiscard]] auto contains(const std::filesystem::path& file, ModelId model) -> bool;

    auto stats(ModelId model) -> std::expected<CacheStats, core::error>;

    /** \brief Models that have a store file in the cache directory. */
    [[nodiscard]] auto cached_models() const -> std::vector<ModelId>;

    [[nodiscard]] auto scan_options() const -> ScanOptions;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lumen::cache
