#pragma once

/** \file model.hpp
 *  \brief Supported embedding models and their fixed properties.
 *
 * The numeric code is persisted in store files and must never be reused.
 */

#include <array>
#include <cstdint>
#include <expected>
#include <string_view>

#include "lumen/error.hpp"

namespace lumen {

/** \brief CLIP variants the cache knows how to store. */
enum class ModelId : std::uint16_t {
  clip_vit_b32 = 1,
  clip_vit_b16 = 2,
  clip_vit_l14 = 3,
  clip_vit_l14_336 = 4,
};

struct ModelInfo {
  ModelId id;
  std::string_view name;   /**< canonical hub identifier */
  std::string_view slug;   /**< file-system safe short name */
  std::uint32_t dim;       /**< embedding dimensionality */
};

inline constexpr ModelId kDefaultModel = ModelId::clip_vit_b32;

/** \brief All supported models, in code order. */
auto all_models() noexcept -> const std::array<ModelInfo, 4>&;

/** \brief Lookup; unsupported when the id is not a known enumerator. */
auto model_info(ModelId id) -> std::expected<ModelInfo, core::error>;

/** \brief Parse a persisted numeric code. */
auto model_from_code(std::uint16_t code) -> std::expected<ModelId, core::error>;

/** \brief Parse either a canonical name or a slug. */
auto parse_model(std::string_view text) -> std::expected<ModelId, core::error>;

/** \brief Embedding dimension; 0 for unsupported ids. */
auto model_dim(ModelId id) noexcept -> std::uint32_t;

} // namespace lumen
