#pragma once

/** \file ingestion_pipeline.hpp
 *  \brief Validate, batch and write records into a collection.
 *
 * insert_many splits its input into batch_size chunks. Each chunk is
 * validated and written as one atomic batch. The first failing batch aborts
 * the call; batches before it stay committed and are reported in
 * BatchReport.
 */

#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "vectra/collection_manager.hpp"
#include "vectra/error.hpp"
#include "vectra/types.hpp"

namespace vectra::ingest {

inline constexpr std::size_t kDefaultBatchSize = 50;

/** \brief Parallel arrays; optional arrays must match texts in length. */
struct InsertManyRequest {
  std::vector<std::string> texts;
  std::vector<std::vector<float>> dense_vectors;
  std::optional<std::vector<std::optional<SparseVector>>> sparse_vectors;
  std::optional<std::vector<std::optional<Metadata>>> metadata;
  std::optional<std::vector<RecordId>> record_ids;
};

/** \brief Per-call accumulator of committed batches. */
struct BatchReport {
  std::size_t batches_committed{0};
  std::size_t records_committed{0};
  std::vector<RecordId> ids;            /**< ids of committed records, input order */
  std::optional<core::error> failure;   /**< set when a batch failed */

  auto ok() const noexcept -> bool { return !failure.has_value(); }
};

class IngestionPipeline {
public:
  explicit IngestionPipeline(const CollectionManager& manager) : manager_(manager) {}

  /** \brief Write a single record. */
  auto insert_one(std::string_view collection, std::string text, std::vector<float> vector,
                  std::optional<Metadata> metadata = std::nullopt,
                  std::optional<RecordId> record_id = std::nullopt,
                  std::optional<SparseVector> sparse = std::nullopt)
      -> std::expected<RecordId, core::error>;

  /** \brief Write records in batches.
   *
   * Unequal parallel arrays, batch_size == 0 or an unknown collection fail
   * before any write. Failures after that are reported in BatchReport::failure.
   */
  auto insert_many(std::string_view collection, InsertManyRequest request,
                   std::size_t batch_size = kDefaultBatchSize)
      -> std::expected<BatchReport, core::error>;

private:
  const CollectionManager& manager_;
};

} // namespace vectra::ingest
