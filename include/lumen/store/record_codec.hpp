#pragma once

/** \file record_codec.hpp
 *  \brief Store header and record frame encode/decode (pure, in-memory).
 *
 * Endianness: little-endian on all platforms.
 *
 * Header (32 bytes):
 *   magic u32 "LMNS" | version u16 | model u16 | dim u32 | count u64 | crc32c u32 | reserved[8]
 *   crc32c covers the first 20 bytes.
 *
 * Record frame:
 *   magic u32 "LMNR" | len u32 | payload | crc32c u32
 *   len is the full frame length; crc32c covers [magic..payload].
 *
 * Record payload:
 *   path_len u32 | path bytes | size u64 | mtime_ns i64 | content_crc u32 |
 *   model u16 | dim u32 | dim x f32 | created_at_ms i64
 *
 * Thread-safety: functions are stateless and thread-safe.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "lumen/error.hpp"
#include "lumen/store/record.hpp"

namespace lumen::store {

constexpr std::uint32_t STORE_MAGIC = 0x534E4D4Cu;  // "LMNS"
constexpr std::uint32_t RECORD_MAGIC = 0x524E4D4Cu; // "LMNR"
constexpr std::uint16_t STORE_VERSION = 1;
constexpr std::size_t STORE_HEADER_SIZE = 32;
constexpr std::size_t RECORD_FRAME_OVERHEAD = 4 + 4 + 4;
constexpr std::size_t MAX_PATH_BYTES = 64 * 1024;

struct StoreHeader {
  std::uint16_t version{STORE_VERSION};
  std::uint16_t model_code{};
  std::uint32_t dim{};
  std::uint64_t count{};
};

auto encode_header(const StoreHeader& h) -> std::vector<std::uint8_t>;

// Verifies magic, version and CRC. Any mismatch is data_integrity.
auto decode_header(std::span<const std::uint8_t> bytes) -> std::expected<StoreHeader, core::error>;

// Encodes one record as a complete frame; invalid_argument on oversize path or dim mismatch.
auto encode_record(const EmbeddingRecord& rec) -> std::expected<std::vector<std::uint8_t>, core::error>;

// Reads the frame length at the start of bytes without validating the frame.
// precondition_failed if fewer than 8 bytes or the magic is wrong.
auto peek_frame_len(std::span<const std::uint8_t> bytes) -> std::expected<std::uint32_t, core::error>;

// Decodes exactly one frame (bytes.size() must equal its len).
auto decode_record(std::span<const std::uint8_t> frame) -> std::expected<EmbeddingRecord, core::error>;

} // namespace lumen::store
