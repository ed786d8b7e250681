#pragma once

/** \file checksum.hpp
 *  \brief CRC32C (Castagnoli) used by the store framing and content fingerprints.
 */

#include <cstdint>
#include <span>

namespace lumen::store {

/** \brief CRC32C over the given bytes. */
auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t;

/** \brief Continue a running CRC32C; start with crc = 0. */
auto crc32c_extend(std::uint32_t crc, std::span<const std::uint8_t> bytes) -> std::uint32_t;

} // namespace lumen::store
