#include "lumen/cache/cache_manager.hpp"
#include "lumen/cache/fingerprint.hpp"
#include "lumen/core/platform_utils.hpp"
#include "lumen/kernels/distance.hpp"
#include "lumen/store/store_file.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace lumen::cache {

using core::error_code;

namespace {

// Tolerance under which a committed vector is taken as already unit length.
constexpr double kUnitTolerance = 1e-4;

auto validate(const EmbeddingRecord& r) -> std::expected<void, core::error> {
    const auto dim = model_dim(r.key.model);
    if (dim == 0) {
        return core::make_unexpected(error_code::unsupported, "unsupported model", "cache.commit");
    }
    if (r.vector.size() != dim) {
        return core::make_unexpected(error_code::invalid_argument,
            "dimension " + std::to_string(r.vector.size()) + " != " + std::to_string(dim) + " for " + r.key.path,
            "cache.commit");
    }
    if (r.key.path.empty() || !std::filesystem::path(r.key.path).is_absolute()) {
        return core::make_unexpected(error_code::invalid_argument,
            "record path must be absolute: \"" + r.key.path + "\"", "cache.commit");
    }
    for (float v : r.vector) {
        if (!std::isfinite(v)) {
            return core::make_unexpected(error_code::invalid_argument,
                "non-finite component in " + r.key.path, "cache.commit");
        }
    }
    if (!(kernels::l2_norm(r.vector) > 0.0)) {
        return core::make_unexpected(error_code::invalid_argument,
            "zero vector for " + r.key.path, "cache.commit");
    }
    return {};
}

auto same_record(const EmbeddingRecord& a, const EmbeddingRecord& b) -> bool {
    return a.key == b.key && a.vector == b.vector && a.created_at == b.created_at;
}

} // namespace

struct CacheManager::Impl {
    CacheConfig config;

    std::mutex write_mutex;                 // serializes store writers
    mutable std::shared_mutex publish_mutex; // guards snapshots / load_stats
    std::unordered_map<ModelId, SnapshotPtr> snapshots;
    std::unordered_map<ModelId, store::StoreReadStats> load_stats;

    explicit Impl(CacheConfig cfg) : config(std::move(cfg)) {}

    [[nodiscard]] bool dbg() const { return config.verbose || core::debug_enabled(); }

    auto published(ModelId model) const -> SnapshotPtr {
        std::shared_lock lock(publish_mutex);
        auto it = snapshots.find(model);
        return it == snapshots.end() ? nullptr : it->second;
    }

    void publish(ModelId model, SnapshotPtr snap) {
        std::unique_lock lock(publish_mutex);
        snapshots[model] = std::move(snap);
    }

    struct DiskLoad {
        SnapshotPtr snapshot;
        store::StoreReadStats stats;
    };

    auto read_from_disk(ModelId model) -> std::expected<DiskLoad, core::error> {
        const auto file = store::store_path(config.cache_dir, model);
        auto contents = store::read_store(file, model);
        if (!contents) {
            if (contents.error().code == error_code::not_found) {
                return DiskLoad{CacheSnapshot::make_empty(model), {}};
            }
            return std::unexpected(contents.error());
        }
        if (dbg()) {
            std::cerr << "[lumen][cache][load] " << file << ": " << contents->stats.loaded << " records, "
                      << contents->stats.discarded << " discarded" << std::endl;
        }
        return DiskLoad{std::make_shared<const CacheSnapshot>(model, std::move(contents->records)),
                        contents->stats};
    }

    auto load(ModelId model) -> std::expected<SnapshotPtr, core::error> {
        if (auto info = model_info(model); !info) return std::unexpected(info.error());
        if (auto snap = published(model)) return snap;

        auto disk = read_from_disk(model);
        if (!disk) return std::unexpected(disk.error());

        // A writer may have published while we were reading; its snapshot wins and
        // the stats of this read describe nothing that is visible.
        std::unique_lock lock(publish_mutex);
        auto [it, inserted] = snapshots.emplace(model, std::move(disk->snapshot));
        if (inserted) load_stats[model] = disk->stats;
        return it->second;
    }

    // Caller holds write_mutex.
    auto reset_corrupt_locked(ModelId model, const core::error& why) -> std::expected<SnapshotPtr, core::error> {
        const auto file = store::store_path(config.cache_dir, model);
        auto aside = file;
        aside += ".corrupt";
        std::cerr << "[lumen][cache] corrupt store " << file << " (" << why.message
                  << "); starting empty" << std::endl;
        std::error_code ec;
        std::filesystem::rename(file, aside, ec);
        if (ec) {
            std::filesystem::remove(file, ec);
            if (ec) {
                return core::make_unexpected(error_code::io_failed,
                    "cannot move corrupt store aside: " + ec.message(), "cache.load");
            }
        }
        auto empty = CacheSnapshot::make_empty(model);
        publish(model, empty);
        return empty;
    }

    // Caller holds write_mutex.
    auto current_locked(ModelId model) -> std::expected<SnapshotPtr, core::error> {
        auto snap = load(model);
        if (!snap && snap.error().code == error_code::data_integrity) {
            return reset_corrupt_locked(model, snap.error());
        }
        return snap;
    }

    // Caller holds write_mutex.
    auto persist_locked(ModelId model, const SnapshotPtr& snap) -> std::expected<void, core::error> {
        std::error_code ec;
        std::filesystem::create_directories(config.cache_dir, ec);
        if (ec) {
            return core::make_unexpected(error_code::io_failed,
                "cannot create cache dir " + config.cache_dir.string() + ": " + ec.message(), "cache.persist");
        }
        const auto file = store::store_path(config.cache_dir, model);
        if (auto w = store::write_store(file, model, snap->records(), store::WriteOptions{config.sync}); !w) {
            return std::unexpected(w.error());
        }
        publish(model, snap);
        return {};
    }
};

CacheManager::CacheManager(CacheConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

CacheManager::~CacheManager() = default;

auto CacheManager::config() const noexcept -> const CacheConfig& { return impl_->config; }

auto CacheManager::store_file(ModelId model) const -> std::filesystem::path {
    return store::store_path(impl_->config.cache_dir, model);
}

auto CacheManager::scan_options() const -> ScanOptions {
    ScanOptions opts{};
    opts.verbose = impl_->config.verbose;
    return opts;
}

auto CacheManager::load(ModelId model) -> std::expected<SnapshotPtr, core::error> {
    return impl_->load(model);
}

auto CacheManager::load_or_reset(ModelId model) -> std::expected<SnapshotPtr, core::error> {
    auto snap = impl_->load(model);
    if (snap || snap.error().code != error_code::data_integrity) return snap;
    std::lock_guard lock(impl_->write_mutex);
    return impl_->current_locked(model);
}

auto CacheManager::diff(std::span<const std::filesystem::path> folders, ModelId model)
    -> std::expected<PendingSet, core::error> {
    auto snap = load_or_reset(model);
    if (!snap) return std::unexpected(snap.error());

    auto files = scan_folders(folders, scan_options());
    if (!files) return std::unexpected(files.error());

    PendingSet pending{};
    pending.model = model;
    pending.scanned = files->size();
    for (auto& path : *files) {
        auto fp = compute_fingerprint(path, impl_->config.fingerprint);
        if (!fp) {
            // Vanished or unreadable since the scan; the next diff will see it again.
            if (impl_->dbg()) {
                std::cerr << "[lumen][cache][diff] skip " << path << ": " << fp.error().message << std::endl;
            }
            continue;
        }
        const auto* rec = (*snap)->find(path);
        if (rec && rec->key.fingerprint == *fp) continue;
        if (rec) ++pending.stale; else ++pending.fresh;
        pending.keys.push_back(ImageKey{std::move(path), *fp, model});
    }
    if (impl_->dbg()) {
        std::cerr << "[lumen][cache][diff] scanned=" << pending.scanned << " fresh=" << pending.fresh
                  << " stale=" << pending.stale << std::endl;
    }
    return pending;
}

auto CacheManager::commit(std::span<const EmbeddingRecord> records) -> std::expected<void, core::error> {
    if (records.empty()) return {};

    std::map<ModelId, std::vector<EmbeddingRecord>> by_model;
    for (const auto& r : records) {
        if (auto ok = validate(r); !ok) return std::unexpected(ok.error());
        EmbeddingRecord copy = r;
        const double n = kernels::l2_norm(copy.vector);
        if (std::abs(n - 1.0) > kUnitTolerance) kernels::normalize(copy.vector);
        // Stored at millisecond resolution; keep memory and disk identical.
        copy.created_at = std::chrono::time_point_cast<std::chrono::milliseconds>(copy.created_at);
        by_model[r.key.model].push_back(std::move(copy));
    }

    std::lock_guard lock(impl_->write_mutex);
    for (auto& [model, incoming] : by_model) {
        auto base = impl_->current_locked(model);
        if (!base) return std::unexpected(base.error());

        const bool unchanged = std::all_of(incoming.begin(), incoming.end(), [&](const EmbeddingRecord& r) {
            const auto* cur = (*base)->find(r.key.path);
            return cur != nullptr && same_record(*cur, r);
        });
        if (unchanged) continue;

        const auto n_in = incoming.size();
        auto next = (*base)->merged(std::move(incoming));
        if (auto p = impl_->persist_locked(model, next); !p) return std::unexpected(p.error());
        if (impl_->dbg()) {
            std::cerr << "[lumen][cache][commit] model=" << static_cast<unsigned>(model) << " +" << n_in
                      << " -> " << next->size() << " records" << std::endl;
        }
    }
    return {};
}

auto CacheManager::prune(std::span<const std::filesystem::path> folders, ModelId model)
    -> std::expected<std::size_t, core::error> {
    if (auto info = model_info(model); !info) return std::unexpected(info.error());

    // Scan results only hold files that exist, so membership covers both conditions.
    auto files = scan_folders(folders, scan_options());
    if (!files) return std::unexpected(files.error());

    std::lock_guard lock(impl_->write_mutex);
    auto snap = impl_->current_locked(model);
    if (!snap) return std::unexpected(snap.error());

    roaring::Roaring dead;
    const auto& recs = (*snap)->records();
    for (std::size_t i = 0; i < recs.size(); ++i) {
        if (!std::binary_search(files->begin(), files->end(), recs[i].key.path)) {
            dead.add(static_cast<std::uint32_t>(i));
        }
    }
    const auto removed = static_cast<std::size_t>(dead.cardinality());
    if (removed == 0) return std::size_t{0};

    auto next = (*snap)->without(dead);
    if (auto p = impl_->persist_locked(model, next); !p) return std::unexpected(p.error());
    if (impl_->dbg()) {
        std::cerr << "[lumen][cache][prune] removed " << removed << ", kept " << next->size() << std::endl;
    }
    return removed;
}

auto CacheManager::remove(const std::filesystem::path& file, ModelId model) -> std::expected<bool, core::error> {
    if (auto info = model_info(model); !info) return std::unexpected(info.error());
    const auto path = normalize_path(file);

    std::lock_guard lock(impl_->write_mutex);
    auto snap = impl_->current_locked(model);
    if (!snap) return std::unexpected(snap.error());
    auto row = (*snap)->find_row(path);
    if (!row) return false;

    roaring::Roaring dead;
    dead.add(static_cast<std::uint32_t>(*row));
    if (auto p = impl_->persist_locked(model, (*snap)->without(dead)); !p) return std::unexpected(p.error());
    return true;
}

auto CacheManager::clear(ModelId model) -> std::expected<void, core::error> {
    if (auto info = model_info(model); !info) return std::unexpected(info.error());

    std::lock_guard lock(impl_->write_mutex);
    std::error_code ec;
    std::filesystem::remove(store_file(model), ec);
    if (ec) {
        return core::make_unexpected(error_code::io_failed, "cannot remove store: " + ec.message(), "cache.clear");
    }
    impl_->publish(model, CacheSnapshot::make_empty(model));
    {
        std::unique_lock plock(impl_->publish_mutex);
        impl_->load_stats.erase(model);
    }
    return {};
}

auto CacheManager::clear_all() -> std::expected<void, core::error> {
    for (const auto& m : all_models()) {
        if (auto r = clear(m.id); !r) return r;
    }
    return {};
}

auto CacheManager::contains(const std::filesystem::path& file, ModelId model) -> bool {
    auto snap = impl_->load(model);
    return snap && (*snap)->find(normalize_path(file)) != nullptr;
}

auto CacheManager::stats(ModelId model) -> std::expected<CacheStats, core::error> {
    auto snap = impl_->load(model);
    if (!snap) return std::unexpected(snap.error());

    CacheStats st{};
    st.model = model;
    st.records = (*snap)->size();
    st.dim = (*snap)->dim();
    std::error_code ec;
    const auto bytes = std::filesystem::file_size(store_file(model), ec);
    st.store_bytes = ec ? 0 : bytes;
    {
        std::shared_lock lock(impl_->publish_mutex);
        if (auto it = impl_->load_stats.find(model); it != impl_->load_stats.end()) {
            st.discarded_on_load = it->second.discarded;
        }
    }
    return st;
}

auto CacheManager::cached_models() const -> std::vector<ModelId> {
    std::vector<ModelId> out;
    for (const auto& m : all_models()) {
        std::error_code ec;
        if (std::filesystem::exists(store_file(m.id), ec)) out.push_back(m.id);
    }
    return out;
}

} // namespace lumen::cache
