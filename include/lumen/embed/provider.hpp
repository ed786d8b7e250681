#pragma once

/** \file provider.hpp
 *  \brief Contract of the external embedding provider.
 *
 * The provider maps (model, kind, payload) to a float vector of model_dim(model).
 * Image payloads are raw file bytes; text payloads are UTF-8. Implementations must be
 * deterministic for identical inputs and safe to call from several threads.
 *
 * Errors:
 * - unavailable      backend unreachable (counts toward a fatal orchestrator run)
 * - provider_failed  payload rejected or inference failed
 */

#include <cstdint>
#include <expected>
#include <span>
#include <string_view>
#include <vector>

#include "lumen/error.hpp"
#include "lumen/model.hpp"

namespace lumen::embed {

enum class EmbedKind : std::uint8_t { image, text };

using Payload = std::span<const std::uint8_t>;

class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual auto embed(ModelId model, EmbedKind kind, Payload payload)
        -> std::expected<std::vector<float>, core::error> = 0;

    /**
     * \brief One call for many payloads. Output order matches input order.
     * The default calls embed() per payload and fails on the first error.
     */
    virtual auto embed_batch(ModelId model, EmbedKind kind, std::span<const Payload> payloads)
        -> std::expected<std::vector<std::vector<float>>, core::error>;

    /** \brief True when embed_batch amortizes work across payloads. */
    [[nodiscard]] virtual auto supports_batching() const noexcept -> bool { return false; }
};

inline auto text_payload(std::string_view text) noexcept -> Payload {
    return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

} // namespace lumen::embed
