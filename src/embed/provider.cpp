#include "lumen/embed/provider.hpp"

namespace lumen::embed {

auto EmbeddingProvider::embed_batch(ModelId model, EmbedKind kind, std::span<const Payload> payloads)
    -> std::expected<std::vector<std::vector<float>>, core::error> {
    std::vector<std::vector<float>> out;
    out.reserve(payloads.size());
    for (const auto& p : payloads) {
        auto v = embed(model, kind, p);
        if (!v) return std::unexpected(v.error());
        out.push_back(std::move(*v));
    }
    return out;
}

} // namespace lumen::embed
