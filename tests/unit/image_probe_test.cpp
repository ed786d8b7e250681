#include <catch2/catch_all.hpp>
#include <lumen/embed/image_probe.hpp>
#include <tests/support/test_helpers.hpp>

#include <string>
#include <string_view>
#include <vector>

using namespace lumen::embed;
using lumen::core::error_code;
using namespace std::string_view_literals;

namespace {
std::vector<std::uint8_t> bytes_of(std::string_view s) {
  return {s.begin(), s.end()};
}
} // namespace

TEST_CASE("probe recognizes supported signatures", "[embed][probe]") {
  std::vector<std::uint8_t> jpeg{0xFF, 0xD8, 0xFF, 0xE1, 0x00};
  REQUIRE(probe_image(jpeg) == ImageFormat::jpeg);
  REQUIRE(probe_image(bytes_of("GIF89a...."sv)) == ImageFormat::gif);
  REQUIRE(probe_image(bytes_of("GIF87a...."sv)) == ImageFormat::gif);
  REQUIRE(probe_image(bytes_of("RIFF\x10\x00\x00\x00WEBPVP8 "sv)) == ImageFormat::webp);
  REQUIRE(probe_image(bytes_of("BM" + std::string(30, '\0'))) == ImageFormat::bmp);
  REQUIRE(format_name(ImageFormat::png) == "png");
}

TEST_CASE("probe rejects look-alikes", "[embed][probe]") {
  REQUIRE(probe_image({}) == ImageFormat::unknown);
  REQUIRE(probe_image(bytes_of("not an image"sv)) == ImageFormat::unknown);
  REQUIRE(probe_image(bytes_of("BM"sv)) == ImageFormat::unknown);           // too short for a bmp
  REQUIRE(probe_image(bytes_of("RIFF\x10\x00\x00\x00WAVE"sv)) == ImageFormat::unknown);
  std::vector<std::uint8_t> png_sig_only{0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
  REQUIRE(probe_image(png_sig_only) == ImageFormat::unknown);
}

TEST_CASE("read_image classifies files", "[embed][probe]") {
  test_support::TempDir dir("probe_read");
  test_support::write_png(dir / "ok.png", 1);
  test_support::write_jpeg(dir / "ok.jpg", 2);
  test_support::write_bytes(dir / "bad.jpg", "this is text, not a jpeg");
  test_support::write_bytes(dir / "empty.png", "");

  auto png = read_image(dir / "ok.png");
  REQUIRE(png.has_value());
  REQUIRE(probe_image(*png) == ImageFormat::png);
  REQUIRE(read_image(dir / "ok.jpg").has_value());

  auto bad = read_image(dir / "bad.jpg");
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.error().code == error_code::decode_failed);

  auto empty = read_image(dir / "empty.png");
  REQUIRE_FALSE(empty.has_value());
  REQUIRE(empty.error().code == error_code::decode_failed);

  auto missing = read_image(dir / "missing.png");
  REQUIRE_FALSE(missing.has_value());
  REQUIRE(missing.error().code == error_code::not_found);
}
