#include "vectra/index/hnsw.hpp"
#include "vectra/kernels/distance.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <queue>
#include <random>

namespace vectra::index {

namespace {

/** \brief Node adjacency, one neighbour list per level. */
struct HnswNode {
  std::uint32_t level{0};
  std::vector<std::vector<std::uint32_t>> neighbors;
};

// (distance, slot); distance = -similarity so smaller is closer.
using Candidate = std::pair<float, std::uint32_t>;

constexpr std::uint32_t kNoEntry = std::numeric_limits<std::uint32_t>::max();

} // namespace

class HnswGraph::Impl {
public:
  Impl(const std::vector<float>& storage, std::size_t dim, const HnswBuildParams& params)
      : storage_(storage), dim_(dim), params_(params), rng_(params.seed) {
    params_.M = std::max<std::uint32_t>(params_.M, 2);
    max_M_ = params_.M;
    max_M0_ = params_.M * 2;
    level_multiplier_ = 1.0f / std::log(static_cast<float>(params_.M));
  }

  auto vec(std::uint32_t slot) const -> std::span<const float> {
    return {storage_.data() + static_cast<std::size_t>(slot) * dim_, dim_};
  }

  auto distance(std::span<const float> a, std::uint32_t slot) const -> float {
    return -kernels::inner_product(a, vec(slot));
  }

  auto select_level() -> std::uint32_t {
    std::uniform_real_distribution<float> dist(std::numeric_limits<float>::min(), 1.0f);
    return static_cast<std::uint32_t>(-std::log(dist(rng_)) * level_multiplier_);
  }

  auto search_layer(std::span<const float> query, std::uint32_t entry_point,
                    std::uint32_t num_closest, std::uint32_t layer,
                    const SlotFilter* accept) const -> std::vector<Candidate>;

  auto select_neighbors(std::vector<Candidate> candidates, std::uint32_t M) const
      -> std::vector<std::uint32_t>;

  auto connect_node(std::uint32_t new_idx, const std::vector<Candidate>& candidates,
                    std::uint32_t level) -> void;

  auto add(std::uint32_t slot) -> void;

  const std::vector<float>& storage_;
  std::size_t dim_;
  HnswBuildParams params_;
  std::uint32_t max_M_{16};
  std::uint32_t max_M0_{32};
  float level_multiplier_{1.0f};
  std::mt19937 rng_;
  std::uint32_t entry_point_{kNoEntry};
  std::vector<HnswNode> nodes_;
};

auto HnswGraph::Impl::search_layer(std::span<const float> query, std::uint32_t entry_point,
                                   std::uint32_t num_closest, std::uint32_t layer,
                                   const SlotFilter* accept) const -> std::vector<Candidate> {
  const std::size_t N = nodes_.size();

  // Thread-local epoch-based visited marking
  struct TLSVisited { std::vector<std::uint32_t> seen; std::uint32_t epoch{0}; };
  thread_local TLSVisited tls;
  if (tls.seen.size() < N) tls.seen.resize(N, 0);
  if (++tls.epoch == 0) { std::fill(tls.seen.begin(), tls.seen.end(), 0u); tls.epoch = 1; }

  // candidates: min-heap on distance; nearest: max-heap, accepted nodes only
  std::priority_queue<Candidate, std::vector<Candidate>, std::greater<>> candidates;
  std::priority_queue<Candidate> nearest;

  const float entry_dist = distance(query, entry_point);
  candidates.emplace(entry_dist, entry_point);
  if (!accept || (*accept)(entry_point)) nearest.emplace(entry_dist, entry_point);
  tls.seen[entry_point] = tls.epoch;

  while (!candidates.empty()) {
    const auto [current_dist, current] = candidates.top();
    if (nearest.size() >= num_closest && current_dist > nearest.top().first) break;
    candidates.pop();

    const auto& node = nodes_[current];
    if (layer >= node.neighbors.size()) continue;
    for (std::uint32_t neighbor : node.neighbors[layer]) {
      if (tls.seen[neighbor] == tls.epoch) continue;
      tls.seen[neighbor] = tls.epoch;

      const float dist = distance(query, neighbor);
      if (nearest.size() < num_closest || dist < nearest.top().first) {
        candidates.emplace(dist, neighbor);
        if (!accept || (*accept)(neighbor)) {
          nearest.emplace(dist, neighbor);
          if (nearest.size() > num_closest) nearest.pop();
        }
      }
    }
  }

  std::vector<Candidate> result;
  result.reserve(nearest.size());
  while (!nearest.empty()) {
    result.push_back(nearest.top());
    nearest.pop();
  }
  // Deterministic ordering on ties (distance, then slot)
  std::sort(result.begin(), result.end());
  return result;
}

// Heuristic selection: keep a candidate only if it is closer to the base than
// to every neighbour already kept, then optionally top up with the pruned ones.
auto HnswGraph::Impl::select_neighbors(std::vector<Candidate> candidates, std::uint32_t M) const
    -> std::vector<std::uint32_t> {
  std::sort(candidates.begin(), candidates.end());
  std::vector<std::uint32_t> selected;
  std::vector<std::uint32_t> pruned;
  selected.reserve(M);
  for (const auto& [dist, idx] : candidates) {
    if (selected.size() >= M) break;
    bool good = true;
    for (std::uint32_t s : selected) {
      if (distance(vec(idx), s) < dist) { good = false; break; }
    }
    if (good) selected.push_back(idx);
    else pruned.push_back(idx);
  }
  if (params_.keep_pruned_connections) {
    for (std::uint32_t idx : pruned) {
      if (selected.size() >= M) break;
      selected.push_back(idx);
    }
  }
  return selected;
}

auto HnswGraph::Impl::connect_node(std::uint32_t new_idx, const std::vector<Candidate>& candidates,
                                   std::uint32_t level) -> void {
  const std::uint32_t max_conn = (level == 0) ? max_M0_ : max_M_;
  auto selected = select_neighbors(candidates, max_M_);
  nodes_[new_idx].neighbors[level] = selected;

  // Reverse edges with back-pruning
  for (std::uint32_t neighbor : selected) {
    auto& nn = nodes_[neighbor].neighbors[level];
    if (std::find(nn.begin(), nn.end(), new_idx) != nn.end()) continue;
    if (nn.size() < max_conn) {
      nn.push_back(new_idx);
      continue;
    }
    std::vector<Candidate> neighbor_candidates;
    neighbor_candidates.reserve(nn.size() + 1);
    const auto nv = vec(neighbor);
    for (std::uint32_t other : nn) neighbor_candidates.emplace_back(distance(nv, other), other);
    neighbor_candidates.emplace_back(distance(nv, new_idx), new_idx);
    nn = select_neighbors(std::move(neighbor_candidates), max_conn);
  }
}

auto HnswGraph::Impl::add(std::uint32_t slot) -> void {
  const std::uint32_t level = select_level();
  HnswNode node;
  node.level = level;
  node.neighbors.resize(level + 1);
  nodes_.push_back(std::move(node));

  if (entry_point_ == kNoEntry) {
    entry_point_ = slot;
    return;
  }

  const auto query = vec(slot);
  std::uint32_t curr = entry_point_;
  const std::uint32_t top = nodes_[entry_point_].level;

  for (std::uint32_t lc = top; lc > level; --lc) {
    auto nearest = search_layer(query, curr, 1, lc, nullptr);
    if (!nearest.empty()) curr = nearest.front().second;
  }

  for (std::int64_t lc = std::min(level, top); lc >= 0; --lc) {
    auto nearest = search_layer(query, curr, params_.ef_construction,
                                static_cast<std::uint32_t>(lc), nullptr);
    connect_node(slot, nearest, static_cast<std::uint32_t>(lc));
    if (!nearest.empty()) curr = nearest.front().second;
  }

  if (level > top) entry_point_ = slot;
}

HnswGraph::HnswGraph(const std::vector<float>& storage, std::size_t dim, const HnswBuildParams& params)
    : impl_(std::make_unique<Impl>(storage, dim, params)) {}

HnswGraph::~HnswGraph() = default;

auto HnswGraph::add(std::uint32_t slot) -> void { impl_->add(slot); }

auto HnswGraph::search(std::span<const float> query, std::uint32_t ef, const SlotFilter& accept) const
    -> std::vector<std::pair<std::uint32_t, float>> {
  std::vector<std::pair<std::uint32_t, float>> out;
  if (impl_->entry_point_ == kNoEntry || ef == 0) return out;

  std::uint32_t curr = impl_->entry_point_;
  for (std::uint32_t lc = impl_->nodes_[curr].level; lc > 0; --lc) {
    auto nearest = impl_->search_layer(query, curr, 1, lc, nullptr);
    if (!nearest.empty()) curr = nearest.front().second;
  }
  auto found = impl_->search_layer(query, curr, ef, 0, accept ? &accept : nullptr);
  out.reserve(found.size());
  for (const auto& [dist, slot] : found) out.emplace_back(slot, -dist);
  return out;
}

auto HnswGraph::size() const noexcept -> std::size_t { return impl_->nodes_.size(); }

auto HnswGraph::stats() const -> HnswStats {
  HnswStats s;
  s.n_nodes = impl_->nodes_.size();
  std::size_t base_edges = 0;
  for (const auto& node : impl_->nodes_) {
    s.n_levels = std::max<std::size_t>(s.n_levels, node.level + 1);
    for (const auto& layer : node.neighbors) s.n_edges += layer.size();
    if (!node.neighbors.empty()) base_edges += node.neighbors[0].size();
  }
  if (s.n_nodes > 0) s.avg_degree = static_cast<float>(base_edges) / static_cast<float>(s.n_nodes);
  return s;
}

auto HnswGraph::reachable_count_base_layer() const -> std::size_t {
  if (impl_->entry_point_ == kNoEntry) return 0;
  std::vector<bool> seen(impl_->nodes_.size(), false);
  std::vector<std::uint32_t> stack{impl_->entry_point_};
  seen[impl_->entry_point_] = true;
  std::size_t count = 0;
  while (!stack.empty()) {
    const std::uint32_t cur = stack.back();
    stack.pop_back();
    ++count;
    for (std::uint32_t nb : impl_->nodes_[cur].neighbors[0]) {
      if (!seen[nb]) { seen[nb] = true; stack.push_back(nb); }
    }
  }
  return count;
}

} // namespace vectra::index
