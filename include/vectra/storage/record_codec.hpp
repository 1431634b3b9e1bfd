#pragma once

/** \file record_codec.hpp
 *  \brief Binary payload encoding for WAL schema and record-batch frames.
 *
 * Little-endian, versioned. A record batch encodes every field of each
 * Record (text, metadata, dense and sparse vectors) so replay rebuilds the
 * store and both indexes exactly.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "vectra/error.hpp"
#include "vectra/types.hpp"

namespace vectra::storage {

constexpr std::uint16_t CODEC_VERSION = 1;

auto encode_schema(const CollectionSchema& schema) -> std::vector<std::uint8_t>;
auto decode_schema(std::span<const std::uint8_t> bytes) -> std::expected<CollectionSchema, core::error>;

auto encode_batch(std::span<const Record> records) -> std::vector<std::uint8_t>;

/** \brief Decode a batch; truncated or malformed payloads yield data_integrity. */
auto decode_batch(std::span<const std::uint8_t> bytes) -> std::expected<std::vector<Record>, core::error>;

} // namespace vectra::storage
