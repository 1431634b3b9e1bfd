#include "vectra/storage/record_log.hpp"
#include "vectra/storage/record_codec.hpp"
#include "vectra/log.hpp"

#include <string>

namespace vectra::storage {

auto WalRecordLog::open(const WalRecordLogOptions& opts)
    -> std::expected<std::unique_ptr<WalRecordLog>, core::error> {
  auto writer = wal::WalWriter::open(
      wal::WalWriterOptions{opts.path, opts.fsync_on_write, opts.truncate_to});
  if (!writer) return std::unexpected(writer.error());
  return std::unique_ptr<WalRecordLog>(new WalRecordLog(std::move(*writer), opts.next_lsn));
}

auto WalRecordLog::append(wal::FrameType type, std::span<const std::uint8_t> payload)
    -> std::expected<void, core::error> {
  const std::uint64_t mark = writer_.size();
  auto r = writer_.append(next_lsn_, static_cast<std::uint16_t>(type), payload);
  if (r) r = writer_.flush();
  if (!r) {
    // The frame may have partly reached the file; cut it so replay cannot resurrect the batch.
    if (auto t = writer_.truncate(mark); !t) {
      logger()->error("[wal] rollback of {} to {} bytes failed: {}", writer_.path().string(), mark,
                      t.error().message);
    }
    return r;
  }
  ++next_lsn_;
  return {};
}

auto WalRecordLog::append_schema(const CollectionSchema& schema) -> std::expected<void, core::error> {
  const auto payload = encode_schema(schema);
  return append(wal::FrameType::Schema, payload);
}

auto WalRecordLog::append_batch(std::span<const Record> records) -> std::expected<void, core::error> {
  const auto payload = encode_batch(records);
  return append(wal::FrameType::RecordBatch, payload);
}

auto WalRecordLog::flush() -> std::expected<void, core::error> {
  return writer_.flush(true);
}

auto replay_log(const std::filesystem::path& path, const ReplayVisitor& visitor)
    -> std::expected<ReplayedLog, core::error> {
  std::optional<CollectionSchema> schema;
  auto stats = wal::recover_scan(path, [&](const wal::WalFrame& frame) -> std::expected<void, core::error> {
    switch (static_cast<wal::FrameType>(frame.type)) {
      case wal::FrameType::Schema: {
        if (schema) {
          return core::make_unexpected(core::error_code::data_integrity,
                                       "duplicate schema frame", "storage.log");
        }
        auto decoded = decode_schema(frame.payload);
        if (!decoded) return std::unexpected(decoded.error());
        schema = std::move(*decoded);
        return visitor.on_schema ? visitor.on_schema(*schema) : std::expected<void, core::error>{};
      }
      case wal::FrameType::RecordBatch: {
        if (!schema) {
          return core::make_unexpected(core::error_code::data_integrity,
                                       "record batch before schema", "storage.log");
        }
        auto records = decode_batch(frame.payload);
        if (!records) return std::unexpected(records.error());
        return visitor.on_batch ? visitor.on_batch(std::move(*records)) : std::expected<void, core::error>{};
      }
    }
    return core::make_unexpected(core::error_code::data_integrity,
                                 "unknown frame type " + std::to_string(frame.type), "storage.log");
  });
  if (!stats) return std::unexpected(stats.error());
  if (!schema && stats->frames == 0) {
    return core::make_unexpected(core::error_code::not_found,
                                 "log holds no complete frame: " + path.string(), "storage.log");
  }
  if (!schema) {
    return core::make_unexpected(core::error_code::data_integrity,
                                 "log has no schema frame: " + path.string(), "storage.log");
  }
  return ReplayedLog{std::move(*schema), *stats};
}

} // namespace vectra::storage
