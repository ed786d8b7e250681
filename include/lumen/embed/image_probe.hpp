#pragma once

/** \file image_probe.hpp
 *  \brief Signature sniffing for the image formats the cache accepts.
 *
 * This is a cheap structural check before bytes reach the provider: a file whose
 * leading bytes are not a JPEG, PNG, GIF, BMP or WEBP header is a decode failure.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

#include "lumen/error.hpp"

namespace lumen::embed {

enum class ImageFormat : std::uint8_t { unknown, jpeg, png, gif, bmp, webp };

auto probe_image(std::span<const std::uint8_t> bytes) noexcept -> ImageFormat;

auto format_name(ImageFormat f) noexcept -> std::string_view;

/**
 * \brief Read a file and check it looks like a supported image.
 * \return decode_failed for empty or unrecognized content, not_found / io_failed for
 *         read errors.
 */
auto read_image(const std::filesystem::path& file) -> std::expected<std::vector<std::uint8_t>, core::error>;

} // namespace lumen::embed
