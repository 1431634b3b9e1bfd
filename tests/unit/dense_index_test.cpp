#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "vectra/index/dense_index.hpp"

#include <algorithm>
#include <limits>
#include <random>
#include <set>

using namespace vectra;
using Catch::Matchers::WithinAbs;

namespace {

std::vector<std::vector<float>> random_vectors(std::size_t n, std::size_t dim, std::uint32_t seed) {
  std::mt19937 rng(seed);
  std::normal_distribution<float> dist(0.0f, 1.0f);
  std::vector<std::vector<float>> out(n, std::vector<float>(dim));
  for (auto& v : out) for (auto& x : v) x = dist(rng);
  return out;
}

} // namespace

TEST_CASE("dense index rejects wrong dimensionality", "[index][dense]") {
  index::DenseIndex idx(3, DistanceMetric::Cosine);
  std::vector<float> v{1, 2};
  REQUIRE(idx.insert(1, v).error().code == core::error_code::dimension_mismatch);
  REQUIRE(idx.size() == 0);
  REQUIRE(idx.search(v, 5).error().code == core::error_code::dimension_mismatch);
}

TEST_CASE("cosine search returns the stored vector first", "[index][dense]") {
  index::DenseIndex idx(3, DistanceMetric::Cosine);
  REQUIRE(idx.insert(0, std::vector<float>{1, 0, 0}).has_value());
  REQUIRE(idx.insert(1, std::vector<float>{0, 1, 0}).has_value());
  REQUIRE(idx.insert(2, std::vector<float>{1, 1, 0}).has_value());

  auto hits = idx.search(std::vector<float>{2, 0, 0}, 5);
  REQUIRE(hits.has_value());
  REQUIRE(hits->size() == 3);
  REQUIRE((*hits)[0].id == 0);
  REQUIRE_THAT((*hits)[0].score, WithinAbs(1.0, 1e-5));
  REQUIRE((*hits)[1].id == 2);
  REQUIRE_THAT((*hits)[2].score, WithinAbs(0.0, 1e-6));
}

TEST_CASE("dot metric scores raw inner products", "[index][dense]") {
  index::DenseIndex idx(2, DistanceMetric::Dot);
  REQUIRE(idx.insert(7, std::vector<float>{1, 1}).has_value());
  REQUIRE(idx.insert(8, std::vector<float>{3, 0}).has_value());
  auto hits = idx.search(std::vector<float>{2, 1}, 2).value();
  REQUIRE(hits[0].id == 8);
  REQUIRE(hits[0].score == 6.0f);
  REQUIRE(hits[1].score == 3.0f);
}

TEST_CASE("equal scores keep insertion order", "[index][dense]") {
  index::DenseIndex idx(2, DistanceMetric::Dot);
  for (RecordId id : {42u, 7u, 19u}) REQUIRE(idx.insert(id, std::vector<float>{1, 0}).has_value());
  auto hits = idx.search(std::vector<float>{1, 0}, 3).value();
  REQUIRE(hits.size() == 3);
  REQUIRE(hits[0].id == 42);
  REQUIRE(hits[1].id == 7);
  REQUIRE(hits[2].id == 19);
}

TEST_CASE("limit, filters, upserts and erase", "[index][dense]") {
  index::DenseIndex idx(2, DistanceMetric::Dot);
  REQUIRE(idx.insert(1, std::vector<float>{1, 0}).has_value());
  REQUIRE(idx.insert(2, std::vector<float>{2, 0}).has_value());
  REQUIRE(idx.insert(3, std::vector<float>{3, 0}).has_value());
  const std::vector<float> q{1, 0};

  REQUIRE(idx.search(q, 0)->empty());
  REQUIRE(idx.search(q, 2)->size() == 2);

  roaring::Roaring64Map allow;
  allow.add(static_cast<std::uint64_t>(1));
  auto filtered = idx.search(q, 5, &allow).value();
  REQUIRE(filtered.size() == 1);
  REQUIRE(filtered[0].id == 1);

  REQUIRE(idx.insert(3, std::vector<float>{0.5f, 0}).has_value());
  REQUIRE(idx.size() == 3);
  auto after = idx.search(q, 5).value();
  REQUIRE(after.size() == 3);
  REQUIRE(after[0].id == 2);
  REQUIRE(after[2].id == 3);

  REQUIRE(idx.erase(2));
  REQUIRE_FALSE(idx.erase(2));
  REQUIRE(idx.size() == 2);
  REQUIRE(idx.search(q, 5)->size() == 2);
}

TEST_CASE("graph search agrees with exact search above the threshold", "[index][dense][hnsw]") {
  constexpr std::size_t n = 600, dim = 16, k = 10;
  index::DenseIndexParams graph_params;
  graph_params.exact_search_threshold = 32;
  graph_params.ef_search = 128;
  index::DenseIndexParams exact_params;
  exact_params.exact_search_threshold = n * 2;

  index::DenseIndex graph(dim, DistanceMetric::Cosine, graph_params);
  index::DenseIndex exact(dim, DistanceMetric::Cosine, exact_params);
  const auto data = random_vectors(n, dim, 7);
  for (std::size_t i = 0; i < n; ++i) {
    REQUIRE(graph.insert(i, data[i]).has_value());
    REQUIRE(exact.insert(i, data[i]).has_value());
  }
  REQUIRE(graph.uses_graph());
  REQUIRE_FALSE(exact.uses_graph());

  const auto queries = random_vectors(20, dim, 99);
  std::size_t found = 0;
  for (const auto& q : queries) {
    auto truth = exact.search(q, k).value();
    auto approx = graph.search(q, k).value();
    REQUIRE(approx.size() == k);
    std::set<RecordId> want;
    for (const auto& h : truth) want.insert(h.id);
    for (const auto& h : approx) found += want.count(h.id);
  }
  const double recall = static_cast<double>(found) / static_cast<double>(queries.size() * k);
  REQUIRE(recall >= 0.9);
}

TEST_CASE("repeated upserts of one id keep storage bounded", "[index][dense]") {
  SECTION("exact scan") {
    index::DenseIndex idx(2, DistanceMetric::Dot);
    for (RecordId id : {1u, 2u, 3u}) REQUIRE(idx.insert(id, std::vector<float>{1, 0}).has_value());
    for (int i = 0; i < 5000; ++i) {
      REQUIRE(idx.insert(2, std::vector<float>{1, 0}).has_value());
      REQUIRE(idx.slot_count() <= 2 * idx.size() + 64);
    }
    REQUIRE(idx.size() == 3);
    auto hits = idx.search(std::vector<float>{1, 0}, 3).value();
    REQUIRE(hits.size() == 3);
    REQUIRE(hits[0].id == 1);
    REQUIRE(hits[1].id == 3);
    REQUIRE(hits[2].id == 2);
  }

  SECTION("graph") {
    constexpr std::size_t n = 40, dim = 8;
    index::DenseIndexParams params;
    params.exact_search_threshold = 16;
    index::DenseIndex idx(dim, DistanceMetric::Cosine, params);
    const auto data = random_vectors(n, dim, 3);
    for (std::size_t i = 0; i < n; ++i) REQUIRE(idx.insert(i, data[i]).has_value());
    for (int i = 0; i < 1000; ++i) {
      REQUIRE(idx.insert(5, data[5]).has_value());
      REQUIRE(idx.slot_count() <= 2 * idx.size() + 64);
    }
    REQUIRE(idx.size() == n);
    REQUIRE(idx.uses_graph());
    auto hits = idx.search(data[5], 1).value();
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].id == 5);
    REQUIRE_THAT(hits[0].score, WithinAbs(1.0, 1e-5));
  }
}

TEST_CASE("non-finite query components are rejected", "[index][dense]") {
  index::DenseIndex idx(2, DistanceMetric::Dot);
  REQUIRE(idx.insert(1, std::vector<float>{1, 0}).has_value());
  REQUIRE(idx.insert(2, std::vector<float>{0, 1}).has_value());
  const float nan = std::numeric_limits<float>::quiet_NaN();
  REQUIRE(idx.search(std::vector<float>{nan, 1}, 2).error().code == core::error_code::validation_failed);
  REQUIRE(idx.insert(3, std::vector<float>{nan, 1}).error().code == core::error_code::validation_failed);
  REQUIRE(idx.size() == 2);
}
