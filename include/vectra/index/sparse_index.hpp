#pragma once

/** \file sparse_index.hpp
 *  \brief Inverted index over sparse vectors: dimension id -> postings.
 *
 * Score of a record for a query is the sum over shared dimension ids of
 * query_weight * record_weight. Records sharing no dimension with the query
 * are never returned. Zero weights are not stored. Slots of erased or
 * replaced records are reclaimed once they outnumber live ones.
 *
 * Thread-safety: insert()/erase() are single-writer; const search() may run
 * concurrently with other searches.
 */

#include <cstdint>
#include <expected>
#include <unordered_map>
#include <vector>

#include <roaring/roaring64map.hh>

#include "vectra/error.hpp"
#include "vectra/types.hpp"

namespace vectra::index {

class SparseIndex {
public:
  /** \brief Insert or replace the sparse vector of `id`.
   *
   * Malformed vectors (length mismatch, duplicate index, non-finite weight)
   * fail with validation_failed and leave the index unchanged.
   */
  auto insert(RecordId id, const SparseVector& vector) -> std::expected<void, core::error>;

  /** \brief Remove all postings of `id`. Returns false if absent. */
  auto erase(RecordId id) -> bool;

  /** \brief Top-`limit` (id, score), descending; ties by insertion order. */
  auto search(const SparseVector& query, std::size_t limit,
              const roaring::Roaring64Map* filter = nullptr) const
      -> std::expected<std::vector<ScoredId>, core::error>;

  auto size() const noexcept -> std::size_t { return id_to_slot_.size(); }
  auto dimensions() const noexcept -> std::size_t { return postings_.size(); }
  auto contains(RecordId id) const -> bool { return id_to_slot_.contains(id); }
  auto slot_count() const noexcept -> std::size_t { return slot_ids_.size(); } /**< live and dead slots */

private:
  auto maybe_compact() -> void;

  struct Posting {
    std::uint32_t slot;
    float weight;
  };

  std::unordered_map<std::uint32_t, std::vector<Posting>> postings_;
  std::vector<RecordId> slot_ids_;
  std::vector<std::vector<std::uint32_t>> slot_dims_;  // dims held by each live slot
  std::unordered_map<RecordId, std::uint32_t> id_to_slot_;
};

} // namespace vectra::index
