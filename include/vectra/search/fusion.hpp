#pragma once

/** \file fusion.hpp
 *  \brief Reciprocal Rank Fusion of dense and sparse result lists.
 *
 * score(r) = sum over lists containing r of 1 / (k + rank), rank 1-based.
 * Output is ordered by score descending, then best (smallest) rank, then
 * record id, and truncated to top_k.
 */

#include <cstdint>
#include <vector>

#include "vectra/types.hpp"

namespace vectra::search {

/** \brief Combined result of both lists. Rank 0 = absent from that list. */
struct FusedResult {
  RecordId id{0};
  float dense_score{0.0f};
  float sparse_score{0.0f};
  float fused_score{0.0f};
  std::uint32_t dense_rank{0};
  std::uint32_t sparse_rank{0};

  auto best_rank() const noexcept -> std::uint32_t;
};

class ReciprocalRankFusion {
public:
  explicit ReciprocalRankFusion(float k = 60.0f) : k_(k) {}

  /** \brief Fuse two ranked lists (each already best-first). */
  auto fuse(const std::vector<ScoredId>& dense_results,
            const std::vector<ScoredId>& sparse_results,
            std::size_t top_k) const -> std::vector<FusedResult>;

  /** \brief RRF score for a record at the given ranks (0 = absent). */
  auto score(std::uint32_t dense_rank, std::uint32_t sparse_rank) const -> float {
    float s = 0.0f;
    if (dense_rank > 0) s += 1.0f / (k_ + static_cast<float>(dense_rank));
    if (sparse_rank > 0) s += 1.0f / (k_ + static_cast<float>(sparse_rank));
    return s;
  }

  auto k() const noexcept -> float { return k_; }
  auto set_k(float k) -> void { k_ = k; }

private:
  float k_;
};

} // namespace vectra::search
