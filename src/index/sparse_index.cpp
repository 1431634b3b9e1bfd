#include "vectra/index/sparse_index.hpp"

#include <algorithm>
#include <unordered_map>
#include <utility>

namespace vectra::index {

namespace {

constexpr std::size_t kCompactMinDead = 64;

} // namespace

auto SparseIndex::maybe_compact() -> void {
  const std::size_t dead = slot_ids_.size() - id_to_slot_.size();
  if (dead < kCompactMinDead || dead <= id_to_slot_.size()) return;

  // Old slot -> new slot; live slots keep their relative order.
  std::vector<std::uint32_t> remap(slot_ids_.size(), 0);
  std::vector<RecordId> slot_ids;
  std::vector<std::vector<std::uint32_t>> slot_dims;
  slot_ids.reserve(id_to_slot_.size());
  slot_dims.reserve(id_to_slot_.size());
  for (std::uint32_t s = 0; s < slot_ids_.size(); ++s) {
    auto it = id_to_slot_.find(slot_ids_[s]);
    if (it == id_to_slot_.end() || it->second != s) continue;
    remap[s] = static_cast<std::uint32_t>(slot_ids.size());
    it->second = remap[s];
    slot_ids.push_back(slot_ids_[s]);
    slot_dims.push_back(std::move(slot_dims_[s]));
  }
  for (auto& [dim, list] : postings_) {
    for (auto& p : list) p.slot = remap[p.slot];
  }
  slot_ids_ = std::move(slot_ids);
  slot_dims_ = std::move(slot_dims);
}

auto SparseIndex::insert(RecordId id, const SparseVector& vector) -> std::expected<void, core::error> {
  if (auto ok = vector.validate(); !ok) return ok;
  const SparseVector compact = vector.compacted();

  erase(id);
  if (compact.empty()) return {};

  const auto slot = static_cast<std::uint32_t>(slot_ids_.size());
  slot_ids_.push_back(id);
  slot_dims_.push_back(compact.indices);
  id_to_slot_.emplace(id, slot);
  for (std::size_t i = 0; i < compact.nnz(); ++i) {
    postings_[compact.indices[i]].push_back(Posting{slot, compact.values[i]});
  }
  maybe_compact();
  return {};
}

auto SparseIndex::erase(RecordId id) -> bool {
  auto it = id_to_slot_.find(id);
  if (it == id_to_slot_.end()) return false;
  const std::uint32_t slot = it->second;
  for (std::uint32_t dim : slot_dims_[slot]) {
    auto pit = postings_.find(dim);
    if (pit == postings_.end()) continue;
    auto& list = pit->second;
    list.erase(std::remove_if(list.begin(), list.end(),
                              [slot](const Posting& p) { return p.slot == slot; }),
               list.end());
    if (list.empty()) postings_.erase(pit);
  }
  slot_dims_[slot].clear();
  slot_dims_[slot].shrink_to_fit();
  id_to_slot_.erase(it);
  maybe_compact();
  return true;
}

auto SparseIndex::search(const SparseVector& query, std::size_t limit,
                         const roaring::Roaring64Map* filter) const
    -> std::expected<std::vector<ScoredId>, core::error> {
  if (auto ok = query.validate(); !ok) return std::unexpected(ok.error());
  std::vector<ScoredId> out;
  if (limit == 0 || id_to_slot_.empty()) return out;

  // Accumulators only for touched slots.
  std::unordered_map<std::uint32_t, float> scores;
  for (std::size_t i = 0; i < query.nnz(); ++i) {
    const float qw = query.values[i];
    if (qw == 0.0f) continue;
    auto pit = postings_.find(query.indices[i]);
    if (pit == postings_.end()) continue;
    for (const auto& p : pit->second) {
      auto it = scores.find(p.slot);
      if (it == scores.end()) {
        if (filter && !filter->contains(slot_ids_[p.slot])) continue;
        it = scores.emplace(p.slot, 0.0f).first;
      }
      it->second += qw * p.weight;
    }
  }

  std::vector<std::pair<std::uint32_t, float>> hits(scores.begin(), scores.end());
  auto better = [](const std::pair<std::uint32_t, float>& a, const std::pair<std::uint32_t, float>& b) {
    if (a.second != b.second) return a.second > b.second;
    return a.first < b.first;
  };
  const std::size_t n = std::min(limit, hits.size());
  std::partial_sort(hits.begin(), hits.begin() + static_cast<std::ptrdiff_t>(n), hits.end(), better);
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) out.push_back(ScoredId{slot_ids_[hits[i].first], hits[i].second});
  return out;
}

} // namespace vectra::index
