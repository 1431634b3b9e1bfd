#include "vectra/types.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_set>

namespace vectra {

auto to_string(DistanceMetric metric) noexcept -> std::string_view {
  switch (metric) {
    case DistanceMetric::Cosine: return "cosine";
    case DistanceMetric::Dot: return "dot";
  }
  return "unknown";
}

auto parse_metric(std::string_view name) -> std::expected<DistanceMetric, core::error> {
  if (name == "cosine") return DistanceMetric::Cosine;
  if (name == "dot" || name == "ip") return DistanceMetric::Dot;
  return core::make_unexpected(core::error_code::config_invalid,
                               "unknown distance metric '" + std::string(name) + "'",
                               "types.metric");
}

auto SparseVector::validate() const -> std::expected<void, core::error> {
  if (indices.size() != values.size()) {
    return core::make_unexpected(core::error_code::validation_failed,
                                 "sparse vector indices/values length mismatch",
                                 "types.sparse");
  }
  std::unordered_set<std::uint32_t> seen;
  seen.reserve(indices.size());
  for (std::size_t i = 0; i < indices.size(); ++i) {
    if (!seen.insert(indices[i]).second) {
      return core::make_unexpected(core::error_code::validation_failed,
                                   "duplicate sparse index " + std::to_string(indices[i]),
                                   "types.sparse");
    }
    if (!std::isfinite(values[i])) {
      return core::make_unexpected(core::error_code::validation_failed,
                                   "non-finite sparse weight", "types.sparse");
    }
  }
  return {};
}

auto SparseVector::compacted() const -> SparseVector {
  std::vector<std::size_t> order(indices.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::sort(order.begin(), order.end(),
            [this](std::size_t a, std::size_t b) { return indices[a] < indices[b]; });

  SparseVector out;
  out.indices.reserve(order.size());
  out.values.reserve(order.size());
  for (std::size_t i : order) {
    if (values[i] == 0.0f) continue;
    out.indices.push_back(indices[i]);
    out.values.push_back(values[i]);
  }
  return out;
}

auto SparseVector::dot(const SparseVector& other) const noexcept -> float {
  float result = 0.0f;
  std::size_t i = 0, j = 0;
  while (i < indices.size() && j < other.indices.size()) {
    if (indices[i] < other.indices[j]) {
      ++i;
    } else if (indices[i] > other.indices[j]) {
      ++j;
    } else {
      result += values[i] * other.values[j];
      ++i;
      ++j;
    }
  }
  return result;
}

} // namespace vectra
