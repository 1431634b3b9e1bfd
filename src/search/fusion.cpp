#include "vectra/search/fusion.hpp"

#include <algorithm>
#include <unordered_map>

namespace vectra::search {

auto FusedResult::best_rank() const noexcept -> std::uint32_t {
  if (dense_rank == 0) return sparse_rank;
  if (sparse_rank == 0) return dense_rank;
  return std::min(dense_rank, sparse_rank);
}

auto ReciprocalRankFusion::fuse(const std::vector<ScoredId>& dense_results,
                                const std::vector<ScoredId>& sparse_results,
                                std::size_t top_k) const -> std::vector<FusedResult> {
  std::unordered_map<RecordId, FusedResult> results;
  results.reserve(dense_results.size() + sparse_results.size());

  for (std::size_t i = 0; i < dense_results.size(); ++i) {
    auto& fused = results[dense_results[i].id];
    fused.id = dense_results[i].id;
    if (fused.dense_rank != 0) continue; // keep the first occurrence
    fused.dense_score = dense_results[i].score;
    fused.dense_rank = static_cast<std::uint32_t>(i + 1);
  }
  for (std::size_t i = 0; i < sparse_results.size(); ++i) {
    auto& fused = results[sparse_results[i].id];
    fused.id = sparse_results[i].id;
    if (fused.sparse_rank != 0) continue;
    fused.sparse_score = sparse_results[i].score;
    fused.sparse_rank = static_cast<std::uint32_t>(i + 1);
  }

  std::vector<FusedResult> output;
  output.reserve(results.size());
  for (auto& [id, fused] : results) {
    fused.fused_score = score(fused.dense_rank, fused.sparse_rank);
    output.push_back(fused);
  }

  std::sort(output.begin(), output.end(), [](const FusedResult& a, const FusedResult& b) {
    if (a.fused_score != b.fused_score) return a.fused_score > b.fused_score;
    if (a.best_rank() != b.best_rank()) return a.best_rank() < b.best_rank();
    return a.id < b.id;
  });
  if (output.size() > top_k) output.resize(top_k);
  return output;
}

} // namespace vectra::search
