#pragma once

/** \file search_engine.hpp
 *  \brief Ranked similarity queries over a model's cached embeddings.
 *
 * Score is the dot product of unit vectors (cosine similarity). Results are sorted by
 * descending score, ties by ascending path; at most top_k hits are returned. Queries run
 * against the snapshot published when the call starts and never block a running commit.
 *
 * Errors:
 * - invalid_argument  top_k <= 0, empty text, query dimension mismatch, zero query vector
 * - unsupported       unknown model
 * - provider errors   propagated as returned (unavailable, provider_failed)
 * - decode_failed / not_found for an unreadable query image
 */

#include <atomic>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "lumen/cache/cache_manager.hpp"
#include "lumen/embed/provider.hpp"
#include "lumen/error.hpp"
#include "lumen/model.hpp"

namespace lumen::search {

struct SearchHit {
  std::string path;
  float score{};
};

using SearchResult = std::vector<SearchHit>;

/** \brief Optional restriction of the ranked set to records under these folders. */
using Scope = std::span<const std::filesystem::path>;

class SearchEngine {
public:
  SearchEngine(cache::CacheManager& cache, embed::EmbeddingProvider& provider);

  auto search_by_text(std::string_view text, ModelId model, int top_k, Scope scope = {})
      -> std::expected<SearchResult, core::error>;

  /**
   * \brief Rank against an image file. A cached record whose fingerprint still matches
   * the file is reused without calling the provider.
   */
  auto search_by_image(const std::filesystem::path& image, ModelId model, int top_k, Scope scope = {})
      -> std::expected<SearchResult, core::error>;

  auto search_by_vector(std::span<const float> query, ModelId model, int top_k, Scope scope = {})
      -> std::expected<SearchResult, core::error>;

  /** \brief Provider calls made by this engine so far. */
  [[nodiscard]] auto provider_calls() const noexcept -> std::uint64_t {
    return provider_calls_.load(std::memory_order_relaxed);
  }

private:
  auto rank(std::vector<float> query, ModelId model, int top_k, Scope scope)
      -> std::expected<SearchResult, core::error>;

  cache::CacheManager& cache_;
  embed::EmbeddingProvider& provider_;
  std::atomic<std::uint64_t> provider_calls_{0};
};

} // namespace lumen::search
