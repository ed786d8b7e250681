#pragma once

/** \file orchestrator.hpp
 *  \brief Drives the provider over a PendingSet in batches.
 *
 * Pipeline per batch: read + probe each image, call the provider (one batch call when
 * it supports batching, else one call per item), validate and normalize the vectors,
 * hand the records to the sink, then report progress. Cancellation is polled between
 * batches (between waves when lanes > 1); work already handed to the sink stays.
 *
 * Failure policy:
 * - unreadable / unrecognized file: per-item decode failure, skipped
 * - provider reports decode_failed: per-item decode failure, never retried; a batch
 *   call failing this way is redone item by item so the rest of the batch survives
 * - failing batch call: retried once as two halves; a half failing again marks its items
 * - failing single-item call: retried once
 * - invalid vector (wrong dimension, non-finite, zero norm): per-item provider failure
 * - every provider call failed with unavailable: the run fails with unavailable
 * - sink failure: the run fails with the sink's error
 * - exception out of the provider (or lanes that cannot start): the run fails with internal
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <future>
#include <memory>
#include <span>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "lumen/cache/cache_manager.hpp"
#include "lumen/embed/provider.hpp"
#include "lumen/error.hpp"
#include "lumen/model.hpp"
#include "lumen/store/record.hpp"

namespace lumen::embed {

struct OrchestratorParams {
    std::size_t batch_size{32};  /**< items per provider batch (>= 1) */
    std::size_t lanes{1};        /**< batches in flight at once (>= 1) */
    bool verbose{false};
};

/** \brief Defaults with LUMEN_BATCH_SIZE / LUMEN_LANES / LUMEN_DEBUG applied. */
auto orchestrator_params_from_env() -> OrchestratorParams;

struct ItemFailure {
    std::string path;
    core::error error;
};

struct RunOutcome {
    std::size_t total{};
    std::size_t succeeded{};
    std::size_t decode_failed{};
    std::size_t provider_failed{};
    std::size_t cancelled_remaining{};  /**< items never attempted because of a stop request */
    std::size_t batches_completed{};
    std::size_t batches_total{};
    bool cancelled{false};
    std::vector<ItemFailure> failures;
    std::vector<EmbeddingRecord> records;
};

using ProgressFn = std::function<void(std::size_t completed, std::size_t total)>;
using BatchSink = std::function<std::expected<void, core::error>(std::span<const EmbeddingRecord>)>;

/** \brief Sink that commits each batch into the cache. */
auto commit_to(cache::CacheManager& cache) -> BatchSink;

class EmbeddingOrchestrator {
public:
    explicit EmbeddingOrchestrator(EmbeddingProvider& provider, OrchestratorParams params = {});

    [[nodiscard]] auto params() const noexcept -> const OrchestratorParams& { return params_; }

    /**
     * \brief Embed every key for `model`.
     * \return invalid_argument if batch_size is 0 or a key belongs to another model;
     *         unavailable / sink error when the run is fatal; otherwise the outcome.
     */
    auto run(std::span<const ImageKey> pending, ModelId model, std::size_t batch_size,
             const ProgressFn& on_progress = {}, std::stop_token stop = {},
             const BatchSink& sink = {}) -> std::expected<RunOutcome, core::error>;

    /** \brief run() over a PendingSet with params().batch_size. */
    auto run(const cache::PendingSet& pending, const ProgressFn& on_progress = {},
             std::stop_token stop = {}, const BatchSink& sink = {})
        -> std::expected<RunOutcome, core::error>;

private:
    EmbeddingProvider& provider_;
    OrchestratorParams params_;
};

/** \brief A run executing on its own thread. Destruction requests stop and joins. */
class BackgroundRun {
public:
    BackgroundRun(EmbeddingOrchestrator& orchestrator, cache::PendingSet pending,
                  ProgressFn on_progress, BatchSink sink);

    BackgroundRun(const BackgroundRun&) = delete;
    BackgroundRun& operator=(const BackgroundRun&) = delete;

    auto request_stop() noexcept -> void { thread_.request_stop(); }

    [[nodiscard]] auto done() const -> bool;

    /** \brief Block until the run finishes; repeated calls return the same outcome. */
    auto wait() -> const std::expected<RunOutcome, core::error>&;

private:
    std::shared_future<std::expected<RunOutcome, core::error>> result_;
    std::jthread thread_;
};

auto start_background(EmbeddingOrchestrator& orchestrator, cache::PendingSet pending,
                      ProgressFn on_progress = {}, BatchSink sink = {})
    -> std::unique_ptr<BackgroundRun>;

} // namespace lumen::embed
