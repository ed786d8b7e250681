#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <lumen/embed/provider.hpp>
#include <lumen/model.hpp>
#include <lumen/store/record.hpp>

namespace test_support {

// Unique directory under the system temp dir, removed on destruction.
class TempDir {
public:
  explicit TempDir(std::string_view tag);
  ~TempDir();
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
  [[nodiscard]] std::filesystem::path operator/(std::string_view rel) const { return path_ / rel; }

private:
  std::filesystem::path path_;
};

// Minimal files that pass the signature probe. `seed` varies the body so that
// different seeds produce different bytes (and different fake embeddings).
void write_png(const std::filesystem::path& file, std::uint32_t seed);
void write_jpeg(const std::filesystem::path& file, std::uint32_t seed);
void write_bytes(const std::filesystem::path& file, std::string_view bytes);

// Moves the file's mtime forward so metadata fingerprints change deterministically.
void bump_mtime(const std::filesystem::path& file, int seconds = 2);

// Deterministic provider: the vector is a function of (model, kind, payload bytes).
class FakeProvider : public lumen::embed::EmbeddingProvider {
public:
  bool batching{false};
  bool unavailable{false};            // every call fails with unavailable
  std::size_t fail_batches_over{0};   // batch calls larger than this fail (0 = never)
  std::size_t fail_first_calls{0};    // the first N calls fail with provider_failed
  std::size_t wrong_dim_by{0};        // returned vectors are this much too long
  std::function<bool(lumen::embed::Payload)> reject;  // payloads failing every time
  lumen::core::error_code reject_code{lumen::core::error_code::provider_failed};

  std::atomic<std::size_t> calls{0};
  std::atomic<std::size_t> batch_calls{0};
  std::atomic<std::size_t> items_embedded{0};

  auto embed(lumen::ModelId model, lumen::embed::EmbedKind kind, lumen::embed::Payload payload)
      -> std::expected<std::vector<float>, lumen::core::error> override;

  auto embed_batch(lumen::ModelId model, lumen::embed::EmbedKind kind,
                   std::span<const lumen::embed::Payload> payloads)
      -> std::expected<std::vector<std::vector<float>>, lumen::core::error> override;

  [[nodiscard]] auto supports_batching() const noexcept -> bool override { return batching; }

  // The vector embed() would return for these bytes, without counting a call.
  static auto vector_for(lumen::ModelId model, lumen::embed::EmbedKind kind, lumen::embed::Payload payload)
      -> std::vector<float>;

private:
  auto next_call_fails() -> bool;
};

// Record with a unit random vector derived from seed, created_at at ms resolution.
auto make_record(std::string path, std::uint32_t seed, lumen::ModelId model = lumen::kDefaultModel)
    -> lumen::EmbeddingRecord;

// Payload containing the given marker string.
auto contains_marker(lumen::embed::Payload payload, std::string_view marker) -> bool;

} // namespace test_support
