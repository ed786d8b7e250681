#include "lumen/model.hpp"

#include <string>

namespace lumen {

namespace {

constexpr std::array<ModelInfo, 4> kModels{{
  {ModelId::clip_vit_b32, "openai/clip-vit-base-patch32", "clip-vit-b32", 512},
  {ModelId::clip_vit_b16, "openai/clip-vit-base-patch16", "clip-vit-b16", 512},
  {ModelId::clip_vit_l14, "openai/clip-vit-large-patch14", "clip-vit-l14", 768},
  {ModelId::clip_vit_l14_336, "openai/clip-vit-large-patch14-336", "clip-vit-l14-336", 768},
}};

} // namespace

auto all_models() noexcept -> const std::array<ModelInfo, 4>& { return kModels; }

auto model_info(ModelId id) -> std::expected<ModelInfo, core::error> {
  for (const auto& m : kModels) {
    if (m.id == id) return m;
  }
  return core::make_unexpected(core::error_code::unsupported,
      "unsupported model id " + std::to_string(static_cast<unsigned>(id)), "model");
}

auto model_from_code(std::uint16_t code) -> std::expected<ModelId, core::error> {
  auto info = model_info(static_cast<ModelId>(code));
  if (!info) return std::unexpected(info.error());
  return info->id;
}

auto parse_model(std::string_view text) -> std::expected<ModelId, core::error> {
  for (const auto& m : kModels) {
    if (text == m.name || text == m.slug) return m.id;
  }
  return core::make_unexpected(core::error_code::unsupported,
      "unknown model \"" + std::string(text) + "\"", "model");
}

auto model_dim(ModelId id) noexcept -> std::uint32_t {
  for (const auto& m : kModels) {
    if (m.id == id) return m.dim;
  }
  return 0;
}

} // namespace lumen
