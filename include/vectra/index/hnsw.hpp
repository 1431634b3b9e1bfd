#pragma once

/** \file hnsw.hpp
 *  \brief Hierarchical Navigable Small World graph over slot-addressed vectors.
 *
 * The graph stores only adjacency. Vector data lives in the owning dense
 * index as one contiguous row-major matrix, addressed by slot. Similarity is
 * the inner product; cosine collections store unit vectors so it is exact
 * for both metrics.
 *
 * Thread-safety: add() is single-writer; const search() is safe for
 * concurrent callers provided no add() runs concurrently.
 * Memory: O(M * N) edges.
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <utility>
#include <vector>

namespace vectra::index {

/** \brief HNSW build parameters. */
struct HnswBuildParams {
  std::uint32_t M{16};                /**< max connections per node on layers > 0 */
  std::uint32_t ef_construction{200}; /**< beam width during construction */
  std::uint32_t seed{42};             /**< level assignment seed */
  bool keep_pruned_connections{true}; /**< top up pruned neighbour lists to M */
};

/** \brief Graph statistics for diagnostics and tests. */
struct HnswStats {
  std::size_t n_nodes{0};
  std::size_t n_edges{0};
  std::size_t n_levels{0};
  float avg_degree{0.0f};
};

class HnswGraph {
public:
  /** \brief Accept predicate over slots; rejected slots are traversed but not returned. */
  using SlotFilter = std::function<bool(std::uint32_t)>;

  /**
   * \param storage row-major vectors [slot x dim], owned by the caller and
   *        outliving the graph; may grow between calls
   */
  HnswGraph(const std::vector<float>& storage, std::size_t dim, const HnswBuildParams& params);
  ~HnswGraph();
  HnswGraph(const HnswGraph&) = delete;
  HnswGraph& operator=(const HnswGraph&) = delete;

  /** \brief Link the next slot (must equal size()) into the graph. O(M log N ef). */
  auto add(std::uint32_t slot) -> void;

  /** \brief Beam search; returns up to ef (slot, similarity) pairs, best first. */
  auto search(std::span<const float> query, std::uint32_t ef,
              const SlotFilter& accept) const
      -> std::vector<std::pair<std::uint32_t, float>>;

  auto size() const noexcept -> std::size_t;
  auto stats() const -> HnswStats;

  /** \brief Nodes reachable from the entry point on layer 0 (diagnostics). */
  auto reachable_count_base_layer() const -> std::size_t;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace vectra::index
