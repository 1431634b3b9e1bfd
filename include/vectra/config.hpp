#pragma once

/** \file config.hpp
 *  \brief Engine options with defaults and environment overrides.
 *
 * Environment (all optional):
 *   VECTRA_STORAGE_ROOT            persistence root; empty keeps data in memory
 *   VECTRA_DISTANCE_METRIC         cosine | dot
 *   VECTRA_BATCH_SIZE              default insert_many batch size
 *   VECTRA_RRF_K                   RRF k constant
 *   VECTRA_PARALLEL_PREFETCH       run hybrid prefetches concurrently
 *   VECTRA_HNSW_M                  graph degree
 *   VECTRA_HNSW_EF_CONSTRUCTION    build beam width
 *   VECTRA_HNSW_EF_SEARCH          query beam width
 *   VECTRA_EXACT_SEARCH_THRESHOLD  exact scan up to this many live vectors
 *   VECTRA_WAL_FSYNC               fsync every committed batch
 *   VECTRA_LOG_LEVEL               trace|debug|info|warn|error|off
 */

#include <cstddef>
#include <expected>
#include <string>

#include "vectra/error.hpp"
#include "vectra/index/dense_index.hpp"
#include "vectra/types.hpp"

namespace vectra {

struct EngineOptions {
  std::string storage_root;                          /**< "" = in-memory */
  DistanceMetric distance_metric{DistanceMetric::Cosine};
  std::size_t batch_size{50};
  float rrf_k{60.0f};
  bool parallel_prefetch{true};
  index::DenseIndexParams dense{};
  bool fsync_on_write{false};
  std::string log_level{"info"};
};

/** \brief Apply VECTRA_* environment overrides on top of `base`.
 *  Malformed values fail with config_invalid naming the variable.
 */
auto options_from_env(EngineOptions base = {}) -> std::expected<EngineOptions, core::error>;

/** \brief Reject zero batch size, non-positive rrf_k, M < 2 and ef_construction < M. */
auto validate_options(const EngineOptions& options) -> std::expected<void, core::error>;

} // namespace vectra
