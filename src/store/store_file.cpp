#include "lumen/store/store_file.hpp"
#include "lumen/store/record_codec.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <unordered_map>

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#endif

namespace lumen::store {

using core::error_code;

namespace {

auto starts_with_magic(const std::vector<std::uint8_t>& bytes, std::size_t at) -> bool {
  if (at > bytes.size() || bytes.size() - at < 4) return false;
  std::uint32_t m = 0;
  std::memcpy(&m, bytes.data() + at, 4);
  return m == RECORD_MAGIC;
}

// Offset of the next RECORD_MAGIC at or after `from`, else bytes.size().
auto find_magic(const std::vector<std::uint8_t>& bytes, std::size_t from) -> std::size_t {
  for (std::size_t at = from; at + 4 <= bytes.size(); ++at) {
    if (starts_with_magic(bytes, at)) return at;
  }
  return bytes.size();
}

} // namespace

auto store_path(const std::filesystem::path& cache_dir, ModelId model) -> std::filesystem::path {
  auto info = model_info(model);
  const std::string slug = info ? std::string(info->slug)
                                : "model-" + std::to_string(static_cast<unsigned>(model));
  return cache_dir / (slug + ".lstore");
}

auto read_store(const std::filesystem::path& file, ModelId model)
    -> std::expected<StoreContents, core::error> {
  const auto info = model_info(model);
  if (!info) return std::unexpected(info.error());

  std::error_code ec;
  if (!std::filesystem::exists(file, ec)) {
    return core::make_unexpected(error_code::not_found, "store file missing", "store.read");
  }
  std::ifstream in(file, std::ios::binary);
  if (!in.good()) {
    return core::make_unexpected(error_code::io_failed, "store open failed: " + file.string(), "store.read");
  }
  std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    return core::make_unexpected(error_code::io_failed, "store read failed: " + file.string(), "store.read");
  }

  auto header = decode_header(bytes);
  if (!header) return std::unexpected(header.error());
  if (header->model_code != static_cast<std::uint16_t>(model) || header->dim != info->dim) {
    return core::make_unexpected(error_code::data_integrity, "store model/dim mismatch", "store.read");
  }

  StoreContents out{};
  out.stats.file_bytes = bytes.size();
  std::unordered_map<std::string, std::size_t> by_path;

  std::size_t pos = STORE_HEADER_SIZE;
  std::size_t accepted = 0;
  while (pos < bytes.size()) {
    const auto rest = std::span<const std::uint8_t>(bytes).subspan(pos);
    auto len = peek_frame_len(rest);
    const bool framed = len && *len >= RECORD_FRAME_OVERHEAD && *len <= rest.size();
    if (framed) {
      auto rec = decode_record(rest.first(*len));
      if (rec && rec->key.model == model) {
        ++accepted;
        if (auto it = by_path.find(rec->key.path); it != by_path.end()) {
          out.records[it->second] = std::move(*rec);
          ++out.stats.duplicates;
        } else {
          by_path.emplace(rec->key.path, out.records.size());
          out.records.push_back(std::move(*rec));
        }
        pos += *len;
        continue;
      }
    }

    // Damaged frame: resume at the next record magic. The frame's own length is
    // tried first so a bad payload behind a good length costs exactly one record.
    ++out.stats.discarded;
    std::size_t next = bytes.size();
    if (framed && pos + *len < bytes.size() && starts_with_magic(bytes, pos + *len)) {
      next = pos + *len;
    } else {
      next = find_magic(bytes, pos + 1);
    }
    out.stats.skipped_bytes += next - pos;
    pos = next;
  }

  if (accepted < header->count) {
    std::cerr << "[lumen][store][load] " << file << ": header lists " << header->count
              << " records, " << accepted << " recovered (" << out.stats.discarded << " damaged regions, "
              << out.stats.skipped_bytes << " bytes skipped)" << std::endl;
  }

  std::sort(out.records.begin(), out.records.end(),
            [](const EmbeddingRecord& a, const EmbeddingRecord& b){ return a.key.path < b.key.path; });
  out.stats.loaded = out.records.size();
  return out;
}

auto write_store(const std::filesystem::path& file, ModelId model,
                 std::span<const EmbeddingRecord> records, const WriteOptions& opts)
    -> std::expected<void, core::error> {
  const auto info = model_info(model);
  if (!info) return std::unexpected(info.error());

  std::vector<std::uint8_t> content = encode_header(StoreHeader{
      STORE_VERSION, static_cast<std::uint16_t>(model), info->dim, records.size()});
  for (const auto& r : records) {
    if (r.key.model != model) {
      return core::make_unexpected(error_code::invalid_argument, "record model mismatch", "store.write");
    }
    auto frame = encode_record(r);
    if (!frame) return std::unexpected(frame.error());
    content.insert(content.end(), frame->begin(), frame->end());
  }

  const auto dir = file.parent_path();
  auto tmp = file;
  tmp += ".tmp";

  // Remove leftover tmp from a previous crashed save. Ignore ENOENT.
  { std::error_code ec; std::filesystem::remove(tmp, ec); }

  // 1) Write tmp (and fsync)
#if defined(__linux__) || defined(__APPLE__)
  int fd = ::open(tmp.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
  if (fd < 0) {
    return core::make_unexpected(error_code::io_failed, "store tmp open failed: " + tmp.string(), "store.write");
  }
  std::size_t written = 0;
  while (written < content.size()) {
    ssize_t n = ::write(fd, content.data() + written, content.size() - written);
    if (n < 0) {
      ::close(fd);
      std::error_code rec; std::filesystem::remove(tmp, rec);
      return core::make_unexpected(error_code::io_failed, "store tmp write failed", "store.write");
    }
    written += static_cast<std::size_t>(n);
  }
  if (opts.sync && ::fsync(fd) != 0) {
    ::close(fd);
    std::error_code rec; std::filesystem::remove(tmp, rec);
    return core::make_unexpected(error_code::io_failed, "store tmp fsync failed", "store.write");
  }
  if (::close(fd) != 0) {
    std::error_code rec; std::filesystem::remove(tmp, rec);
    return core::make_unexpected(error_code::io_failed, "store tmp close failed", "store.write");
  }
#else
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.good()) {
      return core::make_unexpected(error_code::io_failed, "store tmp open failed: " + tmp.string(), "store.write");
    }
    out.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out.good()) {
      out.close();
      std::error_code rec; std::filesystem::remove(tmp, rec);
      return core::make_unexpected(error_code::io_failed, "store tmp write failed", "store.write");
    }
  }
#endif

  // 2) Atomic replace
  {
    std::error_code ec;
    std::filesystem::rename(tmp, file, ec);
    if (ec) {
      std::error_code rec; std::filesystem::remove(tmp, rec);
      return core::make_unexpected(error_code::io_failed, "store rename failed: " + ec.message(), "store.write");
    }
  }

  // 3) Best-effort directory durability
#if defined(__linux__) || defined(__APPLE__)
  if (opts.sync) {
    int dfd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY);
    if (dfd >= 0) { (void)::fsync(dfd); (void)::close(dfd); }
  }
#endif
  return {};
}

} // namespace lumen::store
