#include "lumen/cache/snapshot.hpp"
#include "lumen/cache/folder_scan.hpp"

#include <algorithm>
#include <iterator>

namespace lumen::cache {

namespace {

const auto by_path = [](const EmbeddingRecord& a, const EmbeddingRecord& b) {
    return a.key.path < b.key.path;
};

} // namespace

CacheSnapshot::CacheSnapshot(ModelId model, std::vector<EmbeddingRecord> records)
    : model_(model)
    , dim_(model_dim(model))
    , records_(std::move(records)) {
    // stable so that, among equal paths, the last supplied record survives
    std::stable_sort(records_.begin(), records_.end(), by_path);
    auto last = std::unique(records_.rbegin(), records_.rend(),
        [](const EmbeddingRecord& a, const EmbeddingRecord& b) { return a.key.path == b.key.path; });
    records_.erase(records_.begin(), last.base());
}

auto CacheSnapshot::make_empty(ModelId model) -> std::shared_ptr<const CacheSnapshot> {
    return std::make_shared<const CacheSnapshot>(model, std::vector<EmbeddingRecord>{});
}

auto CacheSnapshot::find_row(std::string_view path) const noexcept -> std::optional<std::size_t> {
    auto it = std::lower_bound(records_.begin(), records_.end(), path,
        [](const EmbeddingRecord& r, std::string_view p) { return r.key.path < p; });
    if (it == records_.end() || it->key.path != path) return std::nullopt;
    return static_cast<std::size_t>(it - records_.begin());
}

auto CacheSnapshot::find(std::string_view path) const noexcept -> const EmbeddingRecord* {
    auto row = find_row(path);
    return row ? &records_[*row] : nullptr;
}

auto CacheSnapshot::rows_under(std::span<const std::string> folders) const -> roaring::Roaring {
    roaring::Roaring rows;
    for (const auto& folder : folders) {
        // Everything under folder shares it as a prefix, so the candidates are contiguous.
        auto it = std::lower_bound(records_.begin(), records_.end(), folder,
            [](const EmbeddingRecord& r, const std::string& f) { return r.key.path < f; });
        for (; it != records_.end() && it->key.path.starts_with(folder); ++it) {
            if (path_under(it->key.path, folder)) {
                rows.add(static_cast<std::uint32_t>(it - records_.begin()));
            }
        }
    }
    rows.runOptimize();
    return rows;
}

auto CacheSnapshot::merged(std::vector<EmbeddingRecord> incoming) const
    -> std::shared_ptr<const CacheSnapshot> {
    std::vector<EmbeddingRecord> all;
    all.reserve(records_.size() + incoming.size());
    all.insert(all.end(), records_.begin(), records_.end());
    std::move(incoming.begin(), incoming.end(), std::back_inserter(all));
    return std::make_shared<const CacheSnapshot>(model_, std::move(all));
}

auto CacheSnapshot::without(const roaring::Roaring& rows) const
    -> std::shared_ptr<const CacheSnapshot> {
    std::vector<EmbeddingRecord> kept;
    kept.reserve(records_.size());
    for (std::size_t i = 0; i < records_.size(); ++i) {
        if (!rows.contains(static_cast<std::uint32_t>(i))) kept.push_back(records_[i]);
    }
    return std::make_shared<const CacheSnapshot>(model_, std::move(kept));
}

} // namespace lumen::cache
