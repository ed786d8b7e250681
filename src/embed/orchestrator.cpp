#include "lumen/embed/orchestrator.hpp"
#include "lumen/core/platform_utils.hpp"
#include "lumen/core/worker_pool.hpp"
#include "lumen/embed/image_probe.hpp"
#include "lumen/kernels/distance.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <iterator>
#include <numeric>
#include <stdexcept>
#include <system_error>

namespace lumen::embed {

using core::error_code;

namespace {

struct CallStats {
    std::atomic<std::size_t> calls{0};
    std::atomic<std::size_t> unavailable{0};
};

struct BatchResult {
    std::size_t attempted{};
    std::size_t decode_failed{};
    std::size_t provider_failed{};
    std::vector<ItemFailure> failures;
    std::vector<EmbeddingRecord> records;
};

// State for one batch once its images are read. Indices refer to keys/bytes.
struct BatchContext {
    EmbeddingProvider& provider;
    ModelId model;
    std::uint32_t dim;
    CallStats& stats;
    bool verbose;
    std::vector<ImageKey> keys;
    std::vector<std::vector<std::uint8_t>> bytes;
    std::chrono::system_clock::time_point now;
    BatchResult& out;
};

template <typename T>
auto tally(CallStats& stats, const std::expected<T, core::error>& r) -> void {
    stats.calls.fetch_add(1, std::memory_order_relaxed);
    if (!r && r.error().code == error_code::unavailable) {
        stats.unavailable.fetch_add(1, std::memory_order_relaxed);
    }
}

auto fail(BatchContext& c, std::size_t i, core::error e) -> void {
    if (e.code == error_code::decode_failed) ++c.out.decode_failed;
    else ++c.out.provider_failed;
    c.out.failures.push_back(ItemFailure{c.keys[i].path, std::move(e)});
}

auto accept(BatchContext& c, std::size_t i, std::vector<float> v) -> void {
    if (v.size() != c.dim) {
        fail(c, i, core::error{error_code::provider_failed,
                               "provider returned dimension " + std::to_string(v.size()) +
                                   ", expected " + std::to_string(c.dim),
                               "orchestrator"});
        return;
    }
    if (!kernels::normalize(v)) {
        fail(c, i, core::error{error_code::provider_failed,
                               "provider returned a non-finite or zero vector", "orchestrator"});
        return;
    }
    c.out.records.push_back(EmbeddingRecord{c.keys[i], std::move(v), c.now});
}

auto call_batch(BatchContext& c, std::span<const std::size_t> idx)
    -> std::expected<std::vector<std::vector<float>>, core::error> {
    std::vector<Payload> payloads;
    payloads.reserve(idx.size());
    for (auto i : idx) payloads.emplace_back(c.bytes[i]);
    auto r = c.provider.embed_batch(c.model, EmbedKind::image, payloads);
    tally(c.stats, r);
    if (r && r->size() != idx.size()) {
        return core::make_unexpected(error_code::provider_failed,
            "provider returned " + std::to_string(r->size()) + " vectors for " +
                std::to_string(idx.size()) + " images",
            "orchestrator");
    }
    return r;
}

auto accept_all(BatchContext& c, std::span<const std::size_t> idx, std::vector<std::vector<float>>& vecs) -> void {
    for (std::size_t k = 0; k < idx.size(); ++k) accept(c, idx[k], std::move(vecs[k]));
}

// A decode failure is a property of the image; calling again cannot help.
auto is_decode(const core::error& e) -> bool { return e.code == error_code::decode_failed; }

// One batch call per item, so an image the provider cannot decode costs only itself.
auto embed_each(BatchContext& c, std::span<const std::size_t> idx) -> void {
    for (std::size_t k = 0; k < idx.size(); ++k) {
        const auto one = idx.subspan(k, 1);
        auto r = call_batch(c, one);
        if (!r && !is_decode(r.error())) r = call_batch(c, one);
        if (r) accept_all(c, one, *r);
        else fail(c, one[0], r.error());
    }
}

auto embed_batched(BatchContext& c, std::span<const std::size_t> idx) -> void {
    auto r = call_batch(c, idx);
    if (r) {
        accept_all(c, idx, *r);
        return;
    }
    if (c.verbose) {
        std::cerr << "[lumen][embed][retry] batch of " << idx.size() << " failed ("
                  << core::to_string(r.error().code) << "): " << r.error().message << "\n";
    }
    if (is_decode(r.error())) {
        if (idx.size() == 1) fail(c, idx[0], r.error());
        else embed_each(c, idx);
        return;
    }
    if (idx.size() == 1) {
        auto again = call_batch(c, idx);
        if (again) accept_all(c, idx, *again);
        else fail(c, idx[0], again.error());
        return;
    }
    const auto mid = idx.size() / 2;
    for (auto half : {idx.first(mid), idx.subspan(mid)}) {
        auto h = call_batch(c, half);
        if (h) {
            accept_all(c, half, *h);
        } else if (is_decode(h.error())) {
            embed_each(c, half);
        } else {
            for (auto i : half) fail(c, i, h.error());
        }
    }
}

auto embed_single(BatchContext& c, std::size_t i) -> void {
    auto r = c.provider.embed(c.model, EmbedKind::image, c.bytes[i]);
    tally(c.stats, r);
    if (!r && !is_decode(r.error())) {
        r = c.provider.embed(c.model, EmbedKind::image, c.bytes[i]);
        tally(c.stats, r);
    }
    if (!r) {
        fail(c, i, r.error());
        return;
    }
    accept(c, i, std::move(*r));
}

auto process_batch(EmbeddingProvider& provider, std::span<const ImageKey> batch, ModelId model,
                   CallStats& stats, bool verbose) -> BatchResult {
    BatchResult out;
    out.attempted = batch.size();
    BatchContext c{provider, model, model_dim(model), stats, verbose, {}, {},
                   std::chrono::system_clock::now(), out};
    c.keys.reserve(batch.size());
    c.bytes.reserve(batch.size());

    for (const auto& key : batch) {
        auto data = read_image(key.path);
        if (!data) {
            ++out.decode_failed;
            out.failures.push_back(ItemFailure{
                key.path, core::error{error_code::decode_failed, data.error().message, "orchestrator.decode"}});
            if (verbose) std::cerr << "[lumen][embed][decode] " << data.error().message << "\n";
            continue;
        }
        c.keys.push_back(key);
        c.bytes.push_back(std::move(*data));
    }
    if (c.keys.empty()) return out;

    if (provider.supports_batching()) {
        std::vector<std::size_t> idx(c.keys.size());
        std::iota(idx.begin(), idx.end(), std::size_t{0});
        embed_batched(c, idx);
    } else {
        for (std::size_t i = 0; i < c.keys.size(); ++i) embed_single(c, i);
    }
    return out;
}

} // namespace

auto orchestrator_params_from_env() -> OrchestratorParams {
    OrchestratorParams p;
    if (auto v = core::env_size("LUMEN_BATCH_SIZE"); v && *v > 0) p.batch_size = *v;
    if (auto v = core::env_size("LUMEN_LANES"); v && *v > 0) p.lanes = *v;
    p.verbose = core::debug_enabled();
    return p;
}

auto commit_to(cache::CacheManager& cache) -> BatchSink {
    return [&cache](std::span<const EmbeddingRecord> records) { return cache.commit(records); };
}

EmbeddingOrchestrator::EmbeddingOrchestrator(EmbeddingProvider& provider, OrchestratorParams params)
    : provider_(provider), params_(params) {}

auto EmbeddingOrchestrator::run(const cache::PendingSet& pending, const ProgressFn& on_progress,
                                std::stop_token stop, const BatchSink& sink)
    -> std::expected<RunOutcome, core::error> {
    return run(pending.keys, pending.model, params_.batch_size, on_progress, std::move(stop), sink);
}

auto EmbeddingOrchestrator::run(std::span<const ImageKey> pending, ModelId model, std::size_t batch_size,
                                const ProgressFn& on_progress, std::stop_token stop,
                                const BatchSink& sink) -> std::expected<RunOutcome, core::error> {
    if (model_dim(model) == 0) {
        return core::make_unexpected(error_code::unsupported, "unsupported model", "orchestrator");
    }
    if (batch_size == 0) {
        return core::make_unexpected(error_code::invalid_argument, "batch_size must be >= 1", "orchestrator");
    }
    for (const auto& key : pending) {
        if (key.model != model) {
            return core::make_unexpected(error_code::invalid_argument,
                "pending key for another model: " + key.path, "orchestrator");
        }
    }

    const bool verbose = params_.verbose || core::debug_enabled();
    const std::size_t lanes = std::max<std::size_t>(1, params_.lanes);

    RunOutcome out;
    out.total = pending.size();
    out.batches_total = (out.total + batch_size - 1) / batch_size;

    auto batch_at = [&](std::size_t b) {
        const auto off = b * batch_size;
        return pending.subspan(off, std::min(batch_size, pending.size() - off));
    };

    // Declared before the pool so in-flight tasks never outlive it.
    CallStats stats;
    std::unique_ptr<core::WorkerPool> pool;
    if (lanes > 1 && out.batches_total > 1) {
        try {
            pool = std::make_unique<core::WorkerPool>(std::min(lanes, out.batches_total));
        } catch (const std::system_error& e) {
            return core::make_unexpected(error_code::internal,
                std::string("cannot start worker lanes: ") + e.what(), "orchestrator");
        }
    }

    std::size_t completed = 0;
    for (std::size_t b = 0; b < out.batches_total;) {
        if (stop.stop_requested()) {
            out.cancelled = true;
            out.cancelled_remaining = out.total - completed;
            if (verbose) {
                std::cerr << "[lumen][embed][" << core::to_string(error_code::cancelled) << "] after "
                          << out.batches_completed << "/" << out.batches_total << " batches, "
                          << out.cancelled_remaining << " items remaining\n";
            }
            break;
        }

        const auto wave_end = pool ? std::min(b + lanes, out.batches_total) : b + 1;
        std::vector<BatchResult> results;
        results.reserve(wave_end - b);
        try {
            if (pool) {
                std::vector<std::future<BatchResult>> futures;
                futures.reserve(wave_end - b);
                for (auto w = b; w < wave_end; ++w) {
                    futures.push_back(pool->submit([this, &stats, model, verbose, keys = batch_at(w)] {
                        return process_batch(provider_, keys, model, stats, verbose);
                    }));
                }
                for (auto& f : futures) results.push_back(f.get());
            } else {
                results.push_back(process_batch(provider_, batch_at(b), model, stats, verbose));
            }
        } catch (const std::exception& e) {
            // Tasks still queued finish before the pool is destroyed; nothing of this wave is committed.
            return core::make_unexpected(error_code::internal,
                std::string("embedding batch threw: ") + e.what(), "orchestrator");
        }

        // Batch order, whatever order the lanes finished in.
        for (auto& r : results) {
            if (sink && !r.records.empty()) {
                if (auto s = sink(r.records); !s) {
                    if (verbose) std::cerr << "[lumen][embed][sink] " << s.error().message << "\n";
                    return std::unexpected(s.error());
                }
            }
            out.succeeded += r.records.size();
            out.decode_failed += r.decode_failed;
            out.provider_failed += r.provider_failed;
            std::move(r.failures.begin(), r.failures.end(), std::back_inserter(out.failures));
            std::move(r.records.begin(), r.records.end(), std::back_inserter(out.records));
            completed += r.attempted;
            ++out.batches_completed;
            if (verbose) {
                std::cerr << "[lumen][embed][batch] " << out.batches_completed << "/" << out.batches_total
                          << " ok=" << out.succeeded << " decode_failed=" << out.decode_failed
                          << " provider_failed=" << out.provider_failed << "\n";
            }
            if (on_progress) on_progress(completed, out.total);
        }
        b = wave_end;
    }

    const auto calls = stats.calls.load(std::memory_order_relaxed);
    if (calls > 0 && stats.unavailable.load(std::memory_order_relaxed) == calls) {
        return core::make_unexpected(error_code::unavailable,
            "embedding provider unavailable: all " + std::to_string(calls) + " calls failed",
            "orchestrator");
    }
    return out;
}

BackgroundRun::BackgroundRun(EmbeddingOrchestrator& orchestrator, cache::PendingSet pending,
                             ProgressFn on_progress, BatchSink sink) {
    std::packaged_task<std::expected<RunOutcome, core::error>(std::stop_token)> task(
        [&orchestrator, pending = std::move(pending), on_progress = std::move(on_progress),
         sink = std::move(sink)](std::stop_token st) {
            return orchestrator.run(pending, on_progress, std::move(st), sink);
        });
    result_ = task.get_future().share();
    thread_ = std::jthread(std::move(task));
}

auto BackgroundRun::done() const -> bool {
    return result_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

auto BackgroundRun::wait() -> const std::expected<RunOutcome, core::error>& {
    return result_.get();
}

auto start_background(EmbeddingOrchestrator& orchestrator, cache::PendingSet pending,
                      ProgressFn on_progress, BatchSink sink) -> std::unique_ptr<BackgroundRun> {
    return std::make_unique<BackgroundRun>(orchestrator, std::move(pending), std::move(on_progress),
                                           std::move(sink));
}

} // namespace lumen::embed
