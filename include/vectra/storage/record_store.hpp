#pragma once

/** \file record_store.hpp
 *  \brief Record id -> payload (text, metadata, vectors) with id assignment.
 *
 * Id assignment: the store keeps next_id = max(every id ever stored) + 1,
 * starting at 0. Omitted ids take next_id, so assigned ids never collide
 * with caller-supplied ids.
 *
 * Thread-safety: not synchronised; the owning collection serialises writers
 * and lets readers share.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

#include <roaring/roaring64map.hh>

#include "vectra/error.hpp"
#include "vectra/filter/filter_expr.hpp"
#include "vectra/types.hpp"

namespace vectra::storage {

class RecordStore {
public:
  /** \brief Ids the given inputs would receive, in order, without mutating the store. */
  auto plan_ids(std::span<const RecordInput> inputs) const -> std::vector<RecordId>;

  /** \brief Insert or overwrite (last write wins). Returns the record id. */
  auto put(Record record) -> RecordId;

  /** \brief put() for each record, in order. */
  auto put_batch(std::vector<Record> records) -> void;

  /** \brief Copy of the record, or not_found. */
  auto get(RecordId id) const -> std::expected<Record, core::error>;

  /** \brief Borrowed pointer, nullptr when absent. Valid until the next write. */
  auto find(RecordId id) const -> const Record*;

  auto contains(RecordId id) const -> bool { return records_.contains(id); }
  auto size() const noexcept -> std::size_t { return records_.size(); }
  auto next_id() const noexcept -> RecordId { return next_id_; }

  /** \brief Ids of records whose metadata satisfies `expr`. */
  auto select(const filter_expr& expr) const -> roaring::Roaring64Map;

private:
  auto bump(RecordId id) noexcept -> void;

  std::unordered_map<RecordId, Record> records_;
  RecordId next_id_{0};
};

} // namespace vectra::storage
