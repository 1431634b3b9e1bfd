#pragma once

/** \file dense_index.hpp
 *  \brief Per-collection dense vector index: exact scan plus HNSW graph.
 *
 * Vectors are stored contiguously by slot. Cosine collections store
 * unit-normalised copies so both metrics score with one inner product.
 * An upsert of an existing record id tombstones the previous slot and
 * appends a new one; tombstoned slots stay in the graph for navigation.
 * Once tombstones outnumber live slots the storage is compacted in slot
 * order and the graph rebuilt, so memory follows the live count.
 *
 * Search is an exact scan while the live count is at most
 * exact_search_threshold or when a payload filter is given; otherwise the
 * HNSW graph is searched with ef = max(ef_search, limit).
 *
 * Thread-safety: insert() is single-writer; const search() may run
 * concurrently with other searches.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <vector>

#include <roaring/roaring64map.hh>

#include "vectra/error.hpp"
#include "vectra/types.hpp"

namespace vectra::index {

struct DenseIndexParams {
  std::uint32_t M{16};
  std::uint32_t ef_construction{200};
  std::uint32_t ef_search{64};
  std::size_t exact_search_threshold{2048};
  std::uint32_t seed{42};
};

class DenseIndex {
public:
  DenseIndex(std::size_t dim, DistanceMetric metric, const DenseIndexParams& params = {});
  ~DenseIndex();
  DenseIndex(const DenseIndex&) = delete;
  DenseIndex& operator=(const DenseIndex&) = delete;

  /** \brief dimension_mismatch unless v.size() == dimension(). */
  auto check_dimension(std::span<const float> v) const -> std::expected<void, core::error>;

  /** \brief check_dimension, then validation_failed on any non-finite component. */
  auto check_vector(std::span<const float> v) const -> std::expected<void, core::error>;

  /** \brief Insert or replace the vector of `id`. No state change on error. */
  auto insert(RecordId id, std::span<const float> values) -> std::expected<void, core::error>;

  /** \brief Drop `id` from results. Returns false if absent. */
  auto erase(RecordId id) -> bool;

  /** \brief Top-`limit` (id, similarity), descending; ties by insertion order.
   *  \param filter optional allow-list of record ids
   */
  auto search(std::span<const float> query, std::size_t limit,
              const roaring::Roaring64Map* filter = nullptr) const
      -> std::expected<std::vector<ScoredId>, core::error>;

  auto size() const noexcept -> std::size_t;          /**< live entries */
  auto dimension() const noexcept -> std::size_t;
  auto metric() const noexcept -> DistanceMetric;
  auto uses_graph() const noexcept -> bool;           /**< HNSW graph has been built */
  auto slot_count() const noexcept -> std::size_t;    /**< stored slots, live or tombstoned */

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace vectra::index
