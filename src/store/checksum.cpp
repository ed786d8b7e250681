#include "lumen/store/checksum.hpp"

#include <array>

namespace lumen::store {

// Reflected CRC-32C (Castagnoli) table using reversed polynomial 0x82F63B78
static constexpr std::array<std::uint32_t, 256> CRC32C_TABLE = []{
  std::array<std::uint32_t, 256> t{};
  const std::uint32_t poly = 0x82F63B78u;
  for (std::uint32_t i = 0; i < 256; ++i) {
    std::uint32_t c = i;
    for (int k = 0; k < 8; ++k) {
      c = (c & 1u) ? (poly ^ (c >> 1)) : (c >> 1);
    }
    t[i] = c;
  }
  return t;
}();

auto crc32c_extend(std::uint32_t crc, std::span<const std::uint8_t> bytes) -> std::uint32_t {
  std::uint32_t c = ~crc;
  for (auto b : bytes) {
    c = CRC32C_TABLE[(c ^ b) & 0xFFu] ^ (c >> 8);
  }
  return ~c;
}

auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t {
  return crc32c_extend(0u, bytes);
}

} // namespace lumen::store
