#pragma once

/** \file frame.hpp
 *  \brief WAL frame encode/decode and CRC32C verification (pure, in-memory).
 *
 * Layout (little-endian): magic u32 | len u32 | type u16 | reserved u16 |
 * lsn u64 | payload | crc32c u32. `len` counts the whole frame.
 * Thread-safety: functions are stateless and thread-safe.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "vectra/error.hpp"

namespace vectra::wal {

constexpr std::uint32_t WAL_MAGIC = 0x4C574356u; // "VCWL"
constexpr std::size_t WAL_HEADER_SIZE = 4 + 4 + 2 + 2 + 8; // 20 bytes
constexpr std::size_t WAL_TRAILER_SIZE = 4;
constexpr std::uint32_t MAX_FRAME_LEN = 256u * 1024u * 1024u;

/** \brief Frame types written by collections. */
enum class FrameType : std::uint16_t {
  Schema = 1,       /**< collection schema, written once at creation */
  RecordBatch = 2   /**< one committed ingestion batch */
};

struct WalFrame {
  std::uint32_t magic;
  std::uint32_t len;
  std::uint16_t type;
  std::uint16_t reserved;
  std::uint64_t lsn;
  std::span<const std::uint8_t> payload; // does not own memory
  std::uint32_t crc32c;                  // Castagnoli over [magic..payload]
};

/** \brief CRC32C (Castagnoli, reflected polynomial 0x82F63B78). */
auto crc32c(std::span<const std::uint8_t> bytes) noexcept -> std::uint32_t;

/** \brief Verify the trailing CRC of a full frame buffer. */
auto verify_crc32c(std::span<const std::uint8_t> full_frame) noexcept -> bool;

/** \brief Encode a frame; fails with invalid_argument when the payload exceeds MAX_FRAME_LEN. */
auto encode_frame(std::uint64_t lsn, std::uint16_t type, std::span<const std::uint8_t> payload)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

/** \brief Decode a frame from a buffer holding exactly one frame. */
auto decode_frame(std::span<const std::uint8_t> bytes) -> std::expected<WalFrame, core::error>;

} // namespace vectra::wal
