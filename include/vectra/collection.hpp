#pragma once

/** \file collection.hpp
 *  \brief A named collection: dense index, sparse index, record store and log.
 *
 * Concurrency: one std::shared_mutex per collection. Searches hold it shared;
 * write_batch holds it exclusive around the log append and the three
 * in-memory applies, so a batch becomes visible atomically.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <span>
#include <vector>

#include "vectra/error.hpp"
#include "vectra/index/dense_index.hpp"
#include "vectra/index/sparse_index.hpp"
#include "vectra/storage/record_log.hpp"
#include "vectra/storage/record_store.hpp"
#include "vectra/types.hpp"

namespace vectra {

class Collection {
public:
  Collection(CollectionSchema schema, const index::DenseIndexParams& dense_params,
             std::unique_ptr<storage::RecordLog> log);
  Collection(const Collection&) = delete;
  Collection& operator=(const Collection&) = delete;

  auto schema() const noexcept -> const CollectionSchema& { return schema_; }
  auto name() const noexcept -> const std::string& { return schema_.name; }

  /** \brief Check every input against the schema without locking or writing.
   *
   * dimension_mismatch for a dense vector of the wrong length,
   * validation_failed for non-finite dense values or a malformed sparse vector.
   */
  auto validate(std::span<const RecordInput> inputs) const -> std::expected<void, core::error>;

  /** \brief Validate, assign ids, log and apply one batch atomically.
   *
   * A log failure yields transient_write and leaves the collection unchanged.
   * \return ids in input order
   */
  auto write_batch(std::span<const RecordInput> inputs) -> std::expected<std::vector<RecordId>, core::error>;

  /** \brief Apply records decoded from the log (no logging). */
  auto apply_replayed(std::vector<Record> records) -> std::expected<void, core::error>;

  /** \brief Swap in the log used for subsequent writes. */
  auto attach_log(std::unique_ptr<storage::RecordLog> log) -> void;

  auto info() const -> CollectionInfo;
  auto get(RecordId id) const -> std::expected<Record, core::error>;
  auto flush() -> std::expected<void, core::error>;

  /** \brief Mark deleted and close the log; later writes fail with not_found.
   *  Caller holds lock_exclusive().
   */
  auto mark_dropped() -> void;

  /** \name Read access under a caller-held shared lock */
  ///@{
  [[nodiscard]] auto lock_shared() const -> std::shared_lock<std::shared_mutex> {
    return std::shared_lock<std::shared_mutex>(mutex_);
  }
  [[nodiscard]] auto lock_exclusive() -> std::unique_lock<std::shared_mutex> {
    return std::unique_lock<std::shared_mutex>(mutex_);
  }
  auto dense() const noexcept -> const index::DenseIndex& { return dense_; }
  auto sparse() const noexcept -> const index::SparseIndex& { return sparse_; }
  auto records() const noexcept -> const storage::RecordStore& { return records_; }
  ///@}

private:
  auto apply(std::vector<Record> records) -> std::expected<void, core::error>;
  auto to_records(std::span<const RecordInput> inputs, const std::vector<RecordId>& ids) const
      -> std::vector<Record>;

  CollectionSchema schema_;
  mutable std::shared_mutex mutex_;
  index::DenseIndex dense_;
  index::SparseIndex sparse_;
  storage::RecordStore records_;
  std::unique_ptr<storage::RecordLog> log_;
  bool dropped_{false};
};

} // namespace vectra
