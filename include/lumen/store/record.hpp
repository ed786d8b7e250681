#pragma once

/** \file record.hpp
 *  \brief Identity and payload types held by the vector record store.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "lumen/model.hpp"

namespace lumen {

/** \brief Change detector for a file: size, mtime and (optionally) a CRC32C of its bytes. */
struct Fingerprint {
  std::uint64_t size_bytes{};
  std::int64_t mtime_ns{};
  std::uint32_t content_crc{};   /**< 0 when computed in metadata mode */

  friend bool operator==(const Fingerprint&, const Fingerprint&) = default;
};

/** \brief Composite identity of one cached embedding. */
struct ImageKey {
  std::string path;              /**< absolute, lexically normal, generic separators */
  Fingerprint fingerprint;
  ModelId model{kDefaultModel};

  friend bool operator==(const ImageKey&, const ImageKey&) = default;
};

/** \brief One stored embedding. Vectors are unit length once committed. */
struct EmbeddingRecord {
  ImageKey key;
  std::vector<float> vector;
  std::chrono::system_clock::time_point created_at{};
};

} // namespace lumen
