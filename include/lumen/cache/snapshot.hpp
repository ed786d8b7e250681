#pragma once

/** \file snapshot.hpp
 *  \brief Immutable point-in-time view of one model's cached embeddings.
 *
 * Rows are ordered by ascending path and paths are unique. A snapshot is never
 * mutated after construction; the cache manager publishes replacements through
 * std::shared_ptr<const CacheSnapshot>, so a reader holding one keeps a consistent
 * view for as long as it likes.
 */

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <roaring/roaring.hh>

#include "lumen/model.hpp"
#include "lumen/store/record.hpp"

namespace lumen::cache {

class CacheSnapshot {
public:
    /** \brief Takes ownership; records are sorted and de-duplicated by path (last wins). */
    CacheSnapshot(ModelId model, std::vector<EmbeddingRecord> records);

    static auto make_empty(ModelId model) -> std::shared_ptr<const CacheSnapshot>;

    [[nodiscard]] auto model() const noexcept -> ModelId { return model_; }
    [[nodiscard]] auto dim() const noexcept -> std::uint32_t { return dim_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return records_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return records_.empty(); }

    [[nodiscard]] auto records() const noexcept -> const std::vector<EmbeddingRecord>& { return records_; }
    [[nodiscard]] auto record(std::size_t row) const -> const EmbeddingRecord& { return records_.at(row); }
    [[nodiscard]] auto row_vector(std::size_t row) const noexcept -> std::span<const float> {
        return records_[row].vector;
    }

    /** \brief Binary search by normalized path. */
    [[nodiscard]] auto find_row(std::string_view path) const noexcept -> std::optional<std::size_t>;
    [[nodiscard]] auto find(std::string_view path) const noexcept -> const EmbeddingRecord*;

    /** \brief Rows whose path lies under any of the (normalized) folders. */
    [[nodiscard]] auto rows_under(std::span<const std::string> folders) const -> roaring::Roaring;

    /**
     * \brief New snapshot with incoming records merged in (same path replaced).
     * Records for other models must not be passed.
     */
    [[nodiscard]] auto merged(std::vector<EmbeddingRecord> incoming) const
        -> std::shared_ptr<const CacheSnapshot>;

    /** \brief New snapshot without the rows in the bitmap. */
    [[nodiscard]] auto without(const roaring::Roaring& rows) const
        -> std::shared_ptr<const CacheSnapshot>;

private:
    ModelId model_;
    std::uint32_t dim_;
    std::vector<EmbeddingRecord> records_;
};

using SnapshotPtr = std::shared_ptr<const CacheSnapshot>;

} // namespace lumen::cache
