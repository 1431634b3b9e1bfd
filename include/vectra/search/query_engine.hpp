#pragma once

/** \file query_engine.hpp
 *  \brief Dense, sparse and hybrid (RRF) queries over managed collections.
 *
 * Every search returns std::nullopt when nothing matches; errors are
 * reserved for unknown collections (not_found), wrong query dimensionality
 * (dimension_mismatch), and non-finite dense or malformed sparse queries
 * (validation_failed).
 *
 * Hybrid flow: dense prefetch (dense_limit) and sparse prefetch
 * (sparse_limit) run independently under the caller's shared collection
 * lock. With parallel_prefetch the sparse side runs on a std::async task;
 * if no thread can be started both run on the caller's thread. The lists
 * are fused with RRF and truncated to limit.
 */

#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "vectra/collection_manager.hpp"
#include "vectra/error.hpp"
#include "vectra/filter/filter_expr.hpp"
#include "vectra/types.hpp"

namespace vectra::search {

struct QueryOptions {
  float rrf_k{60.0f};
  bool parallel_prefetch{true};
};

/** \brief Ranked documents, or nullopt when there are none. */
using SearchResult = std::optional<std::vector<RetrievedDocument>>;

class QueryEngine {
public:
  explicit QueryEngine(const CollectionManager& manager, QueryOptions options = {});

  auto search_dense(std::string_view collection, std::span<const float> vector,
                    std::size_t limit = 5, const filter_expr* filter = nullptr) const
      -> std::expected<SearchResult, core::error>;

  auto search_sparse(std::string_view collection, const SparseVector& vector,
                     std::size_t limit = 5, const filter_expr* filter = nullptr) const
      -> std::expected<SearchResult, core::error>;

  /** \brief Scores are RRF scores. */
  auto search_hybrid(std::string_view collection, std::span<const float> dense_vector,
                     const SparseVector& sparse_vector, std::size_t dense_limit,
                     std::size_t sparse_limit, std::size_t limit,
                     const filter_expr* filter = nullptr) const
      -> std::expected<SearchResult, core::error>;

  auto options() const noexcept -> const QueryOptions& { return options_; }

private:
  const CollectionManager& manager_;
  QueryOptions options_;
};

} // namespace vectra::search
