#include "vectra/wal/io.hpp"

#include <cstring>
#include <string>
#include <system_error>
#include <vector>

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#elif defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace vectra::wal {

namespace {

auto fsync_file_path(const std::filesystem::path& p) -> std::expected<void, core::error> {
  using core::error_code;
#if defined(__linux__) || defined(__APPLE__)
  int fd = ::open(p.string().c_str(), O_RDONLY);
  if (fd < 0) {
    return core::make_unexpected(error_code::io_failed, "fsync open failed", "wal.io");
  }
  int rc = ::fsync(fd);
  (void)::close(fd);
  if (rc != 0) {
    return core::make_unexpected(error_code::io_failed, "fsync failed", "wal.io");
  }
#elif defined(_WIN32)
  HANDLE h = ::CreateFileW(p.wstring().c_str(), GENERIC_READ,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                           nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
  if (h == INVALID_HANDLE_VALUE) {
    return core::make_unexpected(error_code::io_failed, "fsync open failed", "wal.io");
  }
  BOOL ok = ::FlushFileBuffers(h);
  ::CloseHandle(h);
  if (!ok) {
    return core::make_unexpected(error_code::io_failed, "FlushFileBuffers failed", "wal.io");
  }
#endif
  return {};
}

auto read_exact(std::ifstream& in, std::vector<std::uint8_t>& buf, std::size_t offset, std::size_t n) -> bool {
  buf.resize(offset + n);
  in.read(reinterpret_cast<char*>(buf.data() + offset), static_cast<std::streamsize>(n));
  return static_cast<std::size_t>(in.gcount()) == n;
}

} // namespace

WalWriter::~WalWriter() {
  if (out_.is_open()) out_.close();
}

auto WalWriter::open(const WalWriterOptions& opts) -> std::expected<WalWriter, core::error> {
  using core::error_code;
  std::error_code ec;
  if (opts.truncate_to && std::filesystem::exists(opts.path, ec)) {
    std::filesystem::resize_file(opts.path, *opts.truncate_to, ec);
    if (ec) {
      return core::make_unexpected(error_code::io_failed,
                                   "truncate failed: " + ec.message(), "wal.io");
    }
  }
  WalWriter w;
  w.path_ = opts.path;
  w.fsync_on_flush_ = opts.fsync_on_flush;
  w.out_.open(w.path_, std::ios::binary | std::ios::out | std::ios::app);
  if (!w.out_.good()) {
    return core::make_unexpected(error_code::io_failed,
                                 "open failed: " + w.path_.string(), "wal.io");
  }
  w.size_ = std::filesystem::file_size(w.path_, ec);
  if (ec) {
    return core::make_unexpected(error_code::io_failed, "stat failed: " + ec.message(), "wal.io");
  }
  return w;
}

auto WalWriter::truncate(std::uint64_t size) -> std::expected<void, core::error> {
  using core::error_code;
  if (out_.is_open()) out_.close();
  std::error_code ec;
  std::filesystem::resize_file(path_, size, ec);
  if (ec) {
    return core::make_unexpected(error_code::io_failed, "truncate failed: " + ec.message(), "wal.io");
  }
  out_.clear();
  out_.open(path_, std::ios::binary | std::ios::out | std::ios::app);
  if (!out_.good()) {
    return core::make_unexpected(error_code::io_failed, "reopen failed: " + path_.string(), "wal.io");
  }
  size_ = size;
  return {};
}

auto WalWriter::append(std::uint64_t lsn, std::uint16_t type, std::span<const std::uint8_t> payload)
    -> std::expected<void, core::error> {
  using core::error_code;
  if (!out_.is_open() || !out_.good()) {
    return core::make_unexpected(error_code::io_failed, "writer closed", "wal.io");
  }
  auto enc = encode_frame(lsn, type, payload);
  if (!enc) return std::unexpected(enc.error());
  out_.write(reinterpret_cast<const char*>(enc->data()), static_cast<std::streamsize>(enc->size()));
  if (!out_.good()) return core::make_unexpected(error_code::io_failed, "write failed", "wal.io");
  ++frames_;
  size_ += enc->size();
  return {};
}

auto WalWriter::flush(bool sync) -> std::expected<void, core::error> {
  if (!out_.is_open() || !out_.good()) {
    return core::make_unexpected(core::error_code::io_failed, "writer closed", "wal.io");
  }
  out_.flush();
  if (!out_.good()) {
    return core::make_unexpected(core::error_code::io_failed, "flush failed", "wal.io");
  }
  if (sync || fsync_on_flush_) {
    if (auto r = fsync_file_path(path_); !r) return std::unexpected(r.error());
  }
  return {};
}

auto recover_scan(const std::filesystem::path& path, const FrameVisitor& on_frame)
    -> std::expected<RecoveryStats, core::error> {
  RecoveryStats stats{};
  std::ifstream in(path, std::ios::binary);
  if (!in.good()) {
    return core::make_unexpected(core::error_code::not_found,
                                 "open failed: " + path.string(), "wal.io");
  }
  std::error_code fec;
  const std::uint64_t file_size = std::filesystem::file_size(path, fec);
  if (fec) {
    return core::make_unexpected(core::error_code::io_failed,
                                 "stat failed: " + fec.message(), "wal.io");
  }

  auto corrupt = [&path](std::uint64_t offset, const std::string& why) {
    return core::make_unexpected(core::error_code::data_integrity,
                                 path.filename().string() + ": " + why + " at offset " +
                                     std::to_string(offset),
                                 "wal.io");
  };

  std::vector<std::uint8_t> frame;
  while (stats.valid_bytes < file_size) {
    const std::uint64_t remaining = file_size - stats.valid_bytes;
    if (!read_exact(in, frame, 0, WAL_HEADER_SIZE)) { stats.torn_tail = true; break; }
    std::uint32_t magic; std::memcpy(&magic, frame.data(), 4);
    std::uint32_t len; std::memcpy(&len, frame.data() + 4, 4);
    if (magic != WAL_MAGIC || len < WAL_HEADER_SIZE + WAL_TRAILER_SIZE || len > MAX_FRAME_LEN) {
      return corrupt(stats.valid_bytes, "bad frame header");
    }
    // A frame that runs past EOF is an interrupted append.
    if (len > remaining) { stats.torn_tail = true; break; }
    if (!read_exact(in, frame, WAL_HEADER_SIZE, len - WAL_HEADER_SIZE)) { stats.torn_tail = true; break; }
    auto dec = decode_frame(frame);
    if (!dec) {
      // Only the last frame may be partially persisted; anything followed by more bytes is damage.
      if (len == remaining) { stats.torn_tail = true; break; }
      return corrupt(stats.valid_bytes, dec.error().message);
    }

    if (auto r = on_frame(*dec); !r) return std::unexpected(r.error());

    stats.frames += 1;
    stats.bytes += frame.size();
    stats.last_lsn = dec->lsn;
    stats.valid_bytes += frame.size();
  }
  return stats;
}

} // namespace vectra::wal
