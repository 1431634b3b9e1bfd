#include "vectra/index/dense_index.hpp"
#include "vectra/index/hnsw.hpp"
#include "vectra/kernels/distance.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_map>

namespace vectra::index {

namespace {

constexpr std::size_t kCompactMinDead = 64;

auto by_score_then_slot(const std::pair<std::uint32_t, float>& a,
                        const std::pair<std::uint32_t, float>& b) -> bool {
  if (a.second != b.second) return a.second > b.second;
  return a.first < b.first;
}

} // namespace

class DenseIndex::Impl {
public:
  Impl(std::size_t dim, DistanceMetric metric, const DenseIndexParams& params)
      : dim_(dim), metric_(metric), params_(params) {}

  auto row(std::uint32_t slot) const -> std::span<const float> {
    return {storage_.data() + static_cast<std::size_t>(slot) * dim_, dim_};
  }

  auto build_graph() -> void {
    graph_ = std::make_unique<HnswGraph>(
        storage_, dim_,
        HnswBuildParams{params_.M, params_.ef_construction, params_.seed, true});
    for (std::uint32_t s = 0; s < slot_ids_.size(); ++s) graph_->add(s);
  }

  /** Drop tombstoned rows once they outnumber live ones; live slots keep their order. */
  auto maybe_compact() -> void {
    const std::size_t dead = slot_ids_.size() - live_count_;
    if (dead < kCompactMinDead || dead <= live_count_) return;

    std::vector<float> storage;
    std::vector<RecordId> slot_ids;
    storage.reserve(live_count_ * dim_);
    slot_ids.reserve(live_count_);
    for (std::uint32_t s = 0; s < slot_ids_.size(); ++s) {
      if (!live_[s]) continue;
      const auto r = row(s);
      storage.insert(storage.end(), r.begin(), r.end());
      id_to_slot_[slot_ids_[s]] = static_cast<std::uint32_t>(slot_ids.size());
      slot_ids.push_back(slot_ids_[s]);
    }
    graph_.reset();
    storage_ = std::move(storage);
    slot_ids_ = std::move(slot_ids);
    live_.assign(slot_ids_.size(), true);
    if (live_count_ > params_.exact_search_threshold) build_graph();
  }

  auto exact_scan(std::span<const float> q, const roaring::Roaring64Map* filter) const
      -> std::vector<std::pair<std::uint32_t, float>> {
    std::vector<std::pair<std::uint32_t, float>> hits;
    hits.reserve(live_count_);
    for (std::uint32_t s = 0; s < slot_ids_.size(); ++s) {
      if (!live_[s]) continue;
      if (filter && !filter->contains(slot_ids_[s])) continue;
      hits.emplace_back(s, kernels::inner_product(q, row(s)));
    }
    return hits;
  }

  std::size_t dim_;
  DistanceMetric metric_;
  DenseIndexParams params_;
  std::vector<float> storage_;
  std::vector<RecordId> slot_ids_;
  std::vector<bool> live_;
  std::unordered_map<RecordId, std::uint32_t> id_to_slot_;
  std::size_t live_count_{0};
  std::unique_ptr<HnswGraph> graph_;
};

DenseIndex::DenseIndex(std::size_t dim, DistanceMetric metric, const DenseIndexParams& params)
    : impl_(std::make_unique<Impl>(dim, metric, params)) {}

DenseIndex::~DenseIndex() = default;

auto DenseIndex::check_dimension(std::span<const float> v) const -> std::expected<void, core::error> {
  if (v.size() != impl_->dim_) {
    return core::make_unexpected(core::error_code::dimension_mismatch,
                                 "expected dimension " + std::to_string(impl_->dim_) +
                                     ", got " + std::to_string(v.size()),
                                 "index.dense");
  }
  return {};
}

auto DenseIndex::check_vector(std::span<const float> v) const -> std::expected<void, core::error> {
  if (auto ok = check_dimension(v); !ok) return ok;
  for (float x : v) {
    if (!std::isfinite(x)) {
      return core::make_unexpected(core::error_code::validation_failed,
                                   "non-finite dense value", "index.dense");
    }
  }
  return {};
}

auto DenseIndex::insert(RecordId id, std::span<const float> values) -> std::expected<void, core::error> {
  if (auto ok = check_vector(values); !ok) return ok;
  auto& I = *impl_;

  const auto slot = static_cast<std::uint32_t>(I.slot_ids_.size());
  I.storage_.insert(I.storage_.end(), values.begin(), values.end());
  if (I.metric_ == DistanceMetric::Cosine) {
    kernels::normalize_in_place(std::span<float>(I.storage_.data() + static_cast<std::size_t>(slot) * I.dim_, I.dim_));
  }
  I.slot_ids_.push_back(id);
  I.live_.push_back(true);

  if (auto it = I.id_to_slot_.find(id); it != I.id_to_slot_.end()) {
    I.live_[it->second] = false;
    it->second = slot;
  } else {
    I.id_to_slot_.emplace(id, slot);
    ++I.live_count_;
  }

  if (I.graph_) {
    I.graph_->add(slot);
  } else if (I.live_count_ > I.params_.exact_search_threshold) {
    I.build_graph();
  }
  I.maybe_compact();
  return {};
}

auto DenseIndex::erase(RecordId id) -> bool {
  auto& I = *impl_;
  auto it = I.id_to_slot_.find(id);
  if (it == I.id_to_slot_.end()) return false;
  I.live_[it->second] = false;
  I.id_to_slot_.erase(it);
  --I.live_count_;
  I.maybe_compact();
  return true;
}

auto DenseIndex::search(std::span<const float> query, std::size_t limit,
                        const roaring::Roaring64Map* filter) const
    -> std::expected<std::vector<ScoredId>, core::error> {
  if (auto ok = check_vector(query); !ok) return std::unexpected(ok.error());
  const auto& I = *impl_;
  std::vector<ScoredId> out;
  if (limit == 0 || I.live_count_ == 0) return out;

  std::vector<float> q(query.begin(), query.end());
  if (I.metric_ == DistanceMetric::Cosine) kernels::normalize_in_place(q);

  std::vector<std::pair<std::uint32_t, float>> hits;
  if (I.graph_ && !filter && I.live_count_ > I.params_.exact_search_threshold) {
    const auto ef = static_cast<std::uint32_t>(
        std::max<std::size_t>(I.params_.ef_search, limit));
    hits = I.graph_->search(q, ef, [&I](std::uint32_t slot) { return static_cast<bool>(I.live_[slot]); });
  } else {
    hits = I.exact_scan(q, filter);
  }

  const std::size_t n = std::min(limit, hits.size());
  std::partial_sort(hits.begin(), hits.begin() + static_cast<std::ptrdiff_t>(n), hits.end(),
                    by_score_then_slot);
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(ScoredId{I.slot_ids_[hits[i].first], hits[i].second});
  }
  return out;
}

auto DenseIndex::size() const noexcept -> std::size_t { return impl_->live_count_; }
auto DenseIndex::dimension() const noexcept -> std::size_t { return impl_->dim_; }
auto DenseIndex::metric() const noexcept -> DistanceMetric { return impl_->metric_; }
auto DenseIndex::uses_graph() const noexcept -> bool { return impl_->graph_ != nullptr; }
auto DenseIndex::slot_count() const noexcept -> std::size_t { return impl_->slot_ids_.size(); }

} // namespace vectra::index
