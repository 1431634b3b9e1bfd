#pragma once

/** \file record_log.hpp
 *  \brief Durable log of collection writes, one frame per committed batch.
 *
 * RecordLog is the seam between a collection and its persistence: the WAL
 * implementation writes CRC-framed schema and batch frames; the null
 * implementation backs in-memory engines.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "vectra/error.hpp"
#include "vectra/types.hpp"
#include "vectra/wal/io.hpp"

namespace vectra::storage {

class RecordLog {
public:
  virtual ~RecordLog() = default;

  virtual auto append_schema(const CollectionSchema& schema) -> std::expected<void, core::error> = 0;

  /** \brief Append one batch as a single frame and flush it. */
  virtual auto append_batch(std::span<const Record> records) -> std::expected<void, core::error> = 0;

  virtual auto flush() -> std::expected<void, core::error> = 0;
};

/** \brief Log for engines without a storage root. */
class NullRecordLog final : public RecordLog {
public:
  auto append_schema(const CollectionSchema&) -> std::expected<void, core::error> override { return {}; }
  auto append_batch(std::span<const Record>) -> std::expected<void, core::error> override { return {}; }
  auto flush() -> std::expected<void, core::error> override { return {}; }
};

struct WalRecordLogOptions {
  std::filesystem::path path;
  bool fsync_on_write{false};
  std::optional<std::uint64_t> truncate_to; /**< drop a torn tail found during replay */
  std::uint64_t next_lsn{1};
};

/** \brief File-backed log; a failed append is truncated back to the previous end of file. */
class WalRecordLog final : public RecordLog {
public:
  static auto open(const WalRecordLogOptions& opts)
      -> std::expected<std::unique_ptr<WalRecordLog>, core::error>;

  auto append_schema(const CollectionSchema& schema) -> std::expected<void, core::error> override;
  auto append_batch(std::span<const Record> records) -> std::expected<void, core::error> override;
  auto flush() -> std::expected<void, core::error> override;

  auto path() const noexcept -> const std::filesystem::path& { return writer_.path(); }

private:
  explicit WalRecordLog(wal::WalWriter writer, std::uint64_t next_lsn)
      : writer_(std::move(writer)), next_lsn_(next_lsn) {}

  auto append(wal::FrameType type, std::span<const std::uint8_t> payload) -> std::expected<void, core::error>;

  wal::WalWriter writer_;
  std::uint64_t next_lsn_;
};

/** \brief Outcome of replaying a collection log. */
struct ReplayedLog {
  CollectionSchema schema;
  wal::RecoveryStats stats;
};

/** \brief Callbacks driven by replay_log; on_schema always runs before any on_batch. */
struct ReplayVisitor {
  std::function<std::expected<void, core::error>(const CollectionSchema&)> on_schema;
  std::function<std::expected<void, core::error>(std::vector<Record>)> on_batch;
};

/** \brief Replay a collection log frame by frame.
 *
 * A log without any complete frame is not_found; one whose frames lack a
 * schema, or put a batch before it, is data_integrity.
 * A torn tail ends replay cleanly; stats.valid_bytes marks where to truncate.
 */
auto replay_log(const std::filesystem::path& path, const ReplayVisitor& visitor)
    -> std::expected<ReplayedLog, core::error>;

} // namespace vectra::storage
