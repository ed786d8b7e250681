#include "lumen/search/search_engine.hpp"
#include "lumen/cache/fingerprint.hpp"
#include "lumen/core/platform_utils.hpp"
#include "lumen/embed/image_probe.hpp"
#include "lumen/kernels/distance.hpp"
#include "lumen/search/topk.hpp"

#include <iostream>

namespace lumen::search {

using core::error_code;

namespace {

auto check_query(ModelId model, int top_k) -> std::expected<void, core::error> {
  if (model_dim(model) == 0) {
    return core::make_unexpected(error_code::unsupported, "unsupported model", "search");
  }
  if (top_k <= 0) {
    return core::make_unexpected(error_code::invalid_argument,
                                 "top_k must be positive, got " + std::to_string(top_k), "search");
  }
  return {};
}

auto checked_vector(std::vector<float> v, ModelId model, std::string_view what)
    -> std::expected<std::vector<float>, core::error> {
  const auto dim = model_dim(model);
  if (v.size() != dim) {
    return core::make_unexpected(error_code::invalid_argument,
        std::string(what) + " has dimension " + std::to_string(v.size()) + ", model expects " + std::to_string(dim),
        "search");
  }
  if (!kernels::normalize(v)) {
    return core::make_unexpected(error_code::invalid_argument,
                                 std::string(what) + " is zero or non-finite", "search");
  }
  return v;
}

} // namespace

SearchEngine::SearchEngine(cache::CacheManager& cache, embed::EmbeddingProvider& provider)
    : cache_(cache), provider_(provider) {}

auto SearchEngine::search_by_text(std::string_view text, ModelId model, int top_k, Scope scope)
    -> std::expected<SearchResult, core::error> {
  if (auto ok = check_query(model, top_k); !ok) return std::unexpected(ok.error());
  if (text.empty()) {
    return core::make_unexpected(error_code::invalid_argument, "empty text query", "search");
  }
  provider_calls_.fetch_add(1, std::memory_order_relaxed);
  auto v = provider_.embed(model, embed::EmbedKind::text, embed::text_payload(text));
  if (!v) return std::unexpected(v.error());
  auto q = checked_vector(std::move(*v), model, "text embedding");
  if (!q) return std::unexpected(q.error());
  return rank(std::move(*q), model, top_k, scope);
}

auto SearchEngine::search_by_image(const std::filesystem::path& image, ModelId model, int top_k, Scope scope)
    -> std::expected<SearchResult, core::error> {
  if (auto ok = check_query(model, top_k); !ok) return std::unexpected(ok.error());

  const auto key = cache::normalize_path(image);
  auto snap = cache_.load_or_reset(model);
  if (!snap) return std::unexpected(snap.error());

  if (const auto* rec = (*snap)->find(key)) {
    auto fp = cache::compute_fingerprint(key, cache_.config().fingerprint);
    if (!fp) return std::unexpected(fp.error());
    if (*fp == rec->key.fingerprint) {
      if (core::debug_enabled()) std::cerr << "[lumen][search][image] reusing cached vector for " << key << "\n";
      return rank(rec->vector, model, top_k, scope);
    }
  }

  auto bytes = embed::read_image(key);
  if (!bytes) return std::unexpected(bytes.error());
  provider_calls_.fetch_add(1, std::memory_order_relaxed);
  auto v = provider_.embed(model, embed::EmbedKind::image, *bytes);
  if (!v) return std::unexpected(v.error());
  auto q = checked_vector(std::move(*v), model, "image embedding");
  if (!q) return std::unexpected(q.error());
  return rank(std::move(*q), model, top_k, scope);
}

auto SearchEngine::search_by_vector(std::span<const float> query, ModelId model, int top_k, Scope scope)
    -> std::expected<SearchResult, core::error> {
  if (auto ok = check_query(model, top_k); !ok) return std::unexpected(ok.error());
  auto q = checked_vector(std::vector<float>(query.begin(), query.end()), model, "query vector");
  if (!q) return std::unexpected(q.error());
  return rank(std::move(*q), model, top_k, scope);
}

auto SearchEngine::rank(std::vector<float> query, ModelId model, int top_k, Scope scope)
    -> std::expected<SearchResult, core::error> {
  auto loaded = cache_.load_or_reset(model);
  if (!loaded) return std::unexpected(loaded.error());
  const auto& snap = **loaded;
  if (snap.empty()) return SearchResult{};

  TopK best(static_cast<std::size_t>(top_k));
  auto score_row = [&](std::uint32_t row) {
    const auto v = snap.row_vector(row);
    if (v.size() != query.size()) return;
    best.push(kernels::similarity(query, v), row);
  };

  if (scope.empty()) {
    for (std::uint32_t row = 0; row < snap.size(); ++row) score_row(row);
  } else {
    std::vector<std::string> folders;
    folders.reserve(scope.size());
    for (const auto& f : scope) folders.push_back(cache::normalize_path(f));
    const auto rows = snap.rows_under(folders);
    for (auto it = rows.begin(); it != rows.end(); ++it) score_row(*it);
  }

  SearchResult out;
  out.reserve(best.size());
  for (const auto& s : best.take_sorted()) {
    out.push_back(SearchHit{snap.record(s.row).key.path, s.score});
  }
  return out;
}

} // namespace lumen::search
