#pragma once

/** \file io.hpp
 *  \brief Single-file WAL writer and recovery scan.
 *
 * Notes
 * - Writer is not thread-safe; one writer per file. Collections serialise
 *   appends under their exclusive lock.
 * - recover_scan is read-only and reentrant for independent paths.
 * - fsync is optional: flush(true) or WalWriterOptions::fsync_on_flush.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <span>

#include "vectra/error.hpp"
#include "vectra/wal/frame.hpp"

namespace vectra::wal {

struct RecoveryStats {
  std::size_t frames{};             /**< frames delivered */
  std::size_t bytes{};              /**< bytes of delivered frames */
  std::uint64_t last_lsn{};         /**< LSN of the last valid frame */
  std::uint64_t valid_bytes{};      /**< file offset just past the last valid frame */
  bool torn_tail{false};            /**< the final frame was cut short */
};

struct WalWriterOptions {
  std::filesystem::path path;
  bool fsync_on_flush{false};
  /** Truncate the file to this size before appending (drops a torn tail). */
  std::optional<std::uint64_t> truncate_to;
};

class WalWriter {
public:
  WalWriter() = default;
  ~WalWriter();
  WalWriter(WalWriter&&) noexcept = default;
  WalWriter& operator=(WalWriter&&) noexcept = default;
  WalWriter(const WalWriter&) = delete;
  WalWriter& operator=(const WalWriter&) = delete;

  static auto open(const WalWriterOptions& opts) -> std::expected<WalWriter, core::error>;

  auto append(std::uint64_t lsn, std::uint16_t type, std::span<const std::uint8_t> payload)
      -> std::expected<void, core::error>;

  /** Flush buffered data; with sync (or fsync_on_flush) also fsync the file. */
  auto flush(bool sync = false) -> std::expected<void, core::error>;

  /** Close, cut the file back to \p size bytes and reopen for append. */
  auto truncate(std::uint64_t size) -> std::expected<void, core::error>;

  const std::filesystem::path& path() const noexcept { return path_; }
  std::uint64_t frames() const noexcept { return frames_; }
  /** File size as seen by this writer, including unflushed appends. */
  std::uint64_t size() const noexcept { return size_; }

private:
  std::filesystem::path path_;
  bool fsync_on_flush_{false};
  std::uint64_t frames_{};
  std::uint64_t size_{};
  std::ofstream out_;
};

/** \brief Callback for recover_scan; an error stops the scan and is returned. */
using FrameVisitor = std::function<std::expected<void, core::error>(const WalFrame&)>;

/** \brief Sequentially scan a WAL file, delivering each valid frame.
 *
 * An incomplete final frame stops the scan without error (stats.torn_tail is set).
 * A bad header, or a frame that fails its checksum with more bytes after it, is
 * data_integrity. A missing file yields not_found.
 */
[[nodiscard]] auto recover_scan(const std::filesystem::path& path, const FrameVisitor& on_frame)
    -> std::expected<RecoveryStats, core::error>;

} // namespace vectra::wal
