#include "lumen/embed/image_probe.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <system_error>

namespace lumen::embed {

namespace {

template <std::size_t N>
auto starts_with(std::span<const std::uint8_t> bytes, const std::array<std::uint8_t, N>& sig,
                 std::size_t offset = 0) noexcept -> bool {
  if (bytes.size() < offset + N) return false;
  return std::equal(sig.begin(), sig.end(), bytes.begin() + static_cast<std::ptrdiff_t>(offset));
}

constexpr std::array<std::uint8_t, 3> kJpeg{0xFF, 0xD8, 0xFF};
constexpr std::array<std::uint8_t, 8> kPng{0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
constexpr std::array<std::uint8_t, 4> kPngIhdr{'I', 'H', 'D', 'R'};
constexpr std::array<std::uint8_t, 6> kGif87{'G', 'I', 'F', '8', '7', 'a'};
constexpr std::array<std::uint8_t, 6> kGif89{'G', 'I', 'F', '8', '9', 'a'};
constexpr std::array<std::uint8_t, 2> kBmp{'B', 'M'};
constexpr std::array<std::uint8_t, 4> kRiff{'R', 'I', 'F', 'F'};
constexpr std::array<std::uint8_t, 4> kWebp{'W', 'E', 'B', 'P'};

// BITMAPFILEHEADER (14) plus the smallest DIB header (12).
constexpr std::size_t kBmpMinBytes = 26;

} // namespace

auto probe_image(std::span<const std::uint8_t> bytes) noexcept -> ImageFormat {
  if (starts_with(bytes, kJpeg)) return ImageFormat::jpeg;
  if (starts_with(bytes, kPng) && starts_with(bytes, kPngIhdr, 12)) return ImageFormat::png;
  if (starts_with(bytes, kGif87) || starts_with(bytes, kGif89)) return ImageFormat::gif;
  if (starts_with(bytes, kBmp) && bytes.size() >= kBmpMinBytes) return ImageFormat::bmp;
  if (starts_with(bytes, kRiff) && starts_with(bytes, kWebp, 8)) return ImageFormat::webp;
  return ImageFormat::unknown;
}

auto format_name(ImageFormat f) noexcept -> std::string_view {
  switch (f) {
    case ImageFormat::jpeg: return "jpeg";
    case ImageFormat::png: return "png";
    case ImageFormat::gif: return "gif";
    case ImageFormat::bmp: return "bmp";
    case ImageFormat::webp: return "webp";
    case ImageFormat::unknown: break;
  }
  return "unknown";
}

auto read_image(const std::filesystem::path& file) -> std::expected<std::vector<std::uint8_t>, core::error> {
  using core::error_code;
  std::error_code ec;
  if (!std::filesystem::exists(file, ec)) {
    return core::make_unexpected(error_code::not_found, "image not found: " + file.string(), "image_probe");
  }
  std::ifstream in(file, std::ios::binary);
  if (!in) {
    return core::make_unexpected(error_code::io_failed, "cannot open image: " + file.string(), "image_probe");
  }
  std::vector<std::uint8_t> bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  if (in.bad()) {
    return core::make_unexpected(error_code::io_failed, "read failed: " + file.string(), "image_probe");
  }
  if (bytes.empty()) {
    return core::make_unexpected(error_code::decode_failed, "empty image: " + file.string(), "image_probe");
  }
  if (probe_image(bytes) == ImageFormat::unknown) {
    return core::make_unexpected(error_code::decode_failed, "unrecognized image data: " + file.string(),
                                 "image_probe");
  }
  return bytes;
}

} // namespace lumen::embed
