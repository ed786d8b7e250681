#include "lumen/store/record_codec.hpp"
#include "lumen/store/checksum.hpp"

#include <cmath>
#include <cstring>
#include <limits>
#include <string>

namespace lumen::store {

using core::error_code;

namespace {

auto load_le16(const std::uint8_t* p) -> std::uint16_t { std::uint16_t v; std::memcpy(&v, p, 2); return v; }
auto load_le32(const std::uint8_t* p) -> std::uint32_t { std::uint32_t v; std::memcpy(&v, p, 4); return v; }
auto load_le64(const std::uint8_t* p) -> std::uint64_t { std::uint64_t v; std::memcpy(&v, p, 8); return v; }

// Bounds-checked sequential reader over a payload.
struct Cursor {
  const std::uint8_t* p;
  const std::uint8_t* end;

  bool take(void* out, std::size_t n) {
    if (static_cast<std::size_t>(end - p) < n) return false;
    std::memcpy(out, p, n);
    p += n;
    return true;
  }
};

} // namespace

auto encode_header(const StoreHeader& h) -> std::vector<std::uint8_t> {
  std::vector<std::uint8_t> out(STORE_HEADER_SIZE, 0);
  std::uint8_t* p = out.data();
  auto store_le32 = [&](std::uint32_t v){ std::memcpy(p, &v, 4); p += 4; };
  auto store_le16 = [&](std::uint16_t v){ std::memcpy(p, &v, 2); p += 2; };
  auto store_le64 = [&](std::uint64_t v){ std::memcpy(p, &v, 8); p += 8; };

  store_le32(STORE_MAGIC);
  store_le16(h.version);
  store_le16(h.model_code);
  store_le32(h.dim);
  store_le64(h.count);
  store_le32(crc32c({out.data(), 20}));
  return out;
}

auto decode_header(std::span<const std::uint8_t> bytes) -> std::expected<StoreHeader, core::error> {
  if (bytes.size() < STORE_HEADER_SIZE) {
    return core::make_unexpected(error_code::data_integrity, "header too short", "store.header");
  }
  const std::uint8_t* p = bytes.data();
  if (load_le32(p) != STORE_MAGIC) {
    return core::make_unexpected(error_code::data_integrity, "bad magic", "store.header");
  }
  if (load_le32(p + 20) != crc32c({p, 20})) {
    return core::make_unexpected(error_code::data_integrity, "header crc mismatch", "store.header");
  }
  StoreHeader h{};
  h.version = load_le16(p + 4);
  h.model_code = load_le16(p + 6);
  h.dim = load_le32(p + 8);
  h.count = load_le64(p + 12);
  if (h.version != STORE_VERSION) {
    return core::make_unexpected(error_code::data_integrity,
        "unsupported store version " + std::to_string(h.version), "store.header");
  }
  return h;
}

auto encode_record(const EmbeddingRecord& rec) -> std::expected<std::vector<std::uint8_t>, core::error> {
  const std::uint32_t dim = model_dim(rec.key.model);
  if (dim == 0) {
    return core::make_unexpected(error_code::unsupported, "unsupported model", "store.record");
  }
  if (rec.vector.size() != dim) {
    return core::make_unexpected(error_code::invalid_argument,
        "vector dim " + std::to_string(rec.vector.size()) + " != model dim " + std::to_string(dim),
        "store.record");
  }
  if (rec.key.path.empty() || rec.key.path.size() > MAX_PATH_BYTES) {
    return core::make_unexpected(error_code::invalid_argument, "bad path length", "store.record");
  }

  const std::size_t payload = 4 + rec.key.path.size() + 8 + 8 + 4 + 2 + 4
                            + static_cast<std::size_t>(dim) * sizeof(float) + 8;
  const std::size_t len = RECORD_FRAME_OVERHEAD + payload;
  if (len > std::numeric_limits<std::uint32_t>::max()) {
    return core::make_unexpected(error_code::invalid_argument, "record too large", "store.record");
  }

  std::vector<std::uint8_t> out(len);
  std::uint8_t* p = out.data();
  auto store_le16 = [&](std::uint16_t v){ std::memcpy(p, &v, 2); p += 2; };
  auto store_le32 = [&](std::uint32_t v){ std::memcpy(p, &v, 4); p += 4; };
  auto store_le64 = [&](std::uint64_t v){ std::memcpy(p, &v, 8); p += 8; };

  const auto created_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      rec.created_at.time_since_epoch()).count();

  store_le32(RECORD_MAGIC);
  store_le32(static_cast<std::uint32_t>(len));
  store_le32(static_cast<std::uint32_t>(rec.key.path.size()));
  std::memcpy(p, rec.key.path.data(), rec.key.path.size()); p += rec.key.path.size();
  store_le64(rec.key.fingerprint.size_bytes);
  store_le64(static_cast<std::uint64_t>(rec.key.fingerprint.mtime_ns));
  store_le32(rec.key.fingerprint.content_crc);
  store_le16(static_cast<std::uint16_t>(rec.key.model));
  store_le32(dim);
  std::memcpy(p, rec.vector.data(), static_cast<std::size_t>(dim) * sizeof(float));
  p += static_cast<std::size_t>(dim) * sizeof(float);
  store_le64(static_cast<std::uint64_t>(created_ms));
  store_le32(crc32c({out.data(), out.size() - 4}));
  return out;
}

auto peek_frame_len(std::span<const std::uint8_t> bytes) -> std::expected<std::uint32_t, core::error> {
  if (bytes.size() < 8) {
    return core::make_unexpected(error_code::precondition_failed, "frame too short", "store.record");
  }
  if (load_le32(bytes.data()) != RECORD_MAGIC) {
    return core::make_unexpected(error_code::precondition_failed, "bad record magic", "store.record");
  }
  return load_le32(bytes.data() + 4);
}

auto decode_record(std::span<const std::uint8_t> frame) -> std::expected<EmbeddingRecord, core::error> {
  if (frame.size() < RECORD_FRAME_OVERHEAD) {
    return core::make_unexpected(error_code::precondition_failed, "frame too short", "store.record");
  }
  if (load_le32(frame.data()) != RECORD_MAGIC) {
    return core::make_unexpected(error_code::data_integrity, "bad record magic", "store.record");
  }
  if (load_le32(frame.data() + 4) != frame.size()) {
    return core::make_unexpected(error_code::precondition_failed, "len mismatch", "store.record");
  }
  const std::size_t n = frame.size();
  if (load_le32(frame.data() + n - 4) != crc32c(frame.first(n - 4))) {
    return core::make_unexpected(error_code::data_integrity, "crc mismatch", "store.record");
  }

  Cursor c{frame.data() + 8, frame.data() + n - 4};
  EmbeddingRecord rec{};
  std::uint32_t path_len = 0;
  if (!c.take(&path_len, 4) || path_len == 0 || path_len > MAX_PATH_BYTES
      || static_cast<std::size_t>(c.end - c.p) < path_len) {
    return core::make_unexpected(error_code::data_integrity, "bad path length", "store.record");
  }
  rec.key.path.assign(reinterpret_cast<const char*>(c.p), path_len);
  c.p += path_len;

  std::uint64_t mtime = 0;
  std::uint16_t model_code = 0;
  std::uint32_t dim = 0;
  if (!c.take(&rec.key.fingerprint.size_bytes, 8) || !c.take(&mtime, 8)
      || !c.take(&rec.key.fingerprint.content_crc, 4) || !c.take(&model_code, 2)
      || !c.take(&dim, 4)) {
    return core::make_unexpected(error_code::data_integrity, "truncated record", "store.record");
  }
  rec.key.fingerprint.mtime_ns = static_cast<std::int64_t>(mtime);

  auto model = model_from_code(model_code);
  if (!model) {
    return core::make_unexpected(error_code::data_integrity, "unknown model code", "store.record");
  }
  rec.key.model = *model;
  if (dim != model_dim(*model)) {
    return core::make_unexpected(error_code::data_integrity, "dim does not match model", "store.record");
  }

  rec.vector.resize(dim);
  std::uint64_t created_ms = 0;
  if (!c.take(rec.vector.data(), static_cast<std::size_t>(dim) * sizeof(float))
      || !c.take(&created_ms, 8) || c.p != c.end) {
    return core::make_unexpected(error_code::data_integrity, "payload size mismatch", "store.record");
  }
  for (float v : rec.vector) {
    if (!std::isfinite(v)) {
      return core::make_unexpected(error_code::data_integrity, "non-finite component", "store.record");
    }
  }
  rec.created_at = std::chrono::system_clock::time_point(
      std::chrono::milliseconds(static_cast<std::int64_t>(created_ms)));
  return rec;
}

} // namespace lumen::store
