#include <catch2/catch_test_macros.hpp>

#include "vectra/index/hnsw.hpp"
#include "vectra/kernels/distance.hpp"

#include <random>

using namespace vectra;

TEST_CASE("HNSW base layer stays connected", "[index][hnsw]") {
  constexpr std::size_t n = 500, dim = 8;
  std::vector<float> storage(n * dim);
  std::mt19937 rng(3);
  std::normal_distribution<float> dist;
  for (auto& x : storage) x = dist(rng);
  for (std::size_t i = 0; i < n; ++i) {
    kernels::normalize_in_place(std::span<float>(storage.data() + i * dim, dim));
  }

  index::HnswGraph g(storage, dim, index::HnswBuildParams{8, 64, 1, true});
  for (std::uint32_t s = 0; s < n; ++s) g.add(s);

  REQUIRE(g.size() == n);
  REQUIRE(g.reachable_count_base_layer() == n);
  auto st = g.stats();
  REQUIRE(st.n_nodes == n);
  REQUIRE(st.n_levels >= 1);
  REQUIRE(st.avg_degree > 0.0f);
}

TEST_CASE("HNSW search finds a stored point and honours the slot filter", "[index][hnsw]") {
  constexpr std::size_t dim = 4;
  std::vector<float> storage;
  for (std::uint32_t i = 0; i < 64; ++i) {
    std::vector<float> v{static_cast<float>(i % 4 == 0), static_cast<float>(i % 4 == 1),
                         static_cast<float>(i % 4 == 2), static_cast<float>(i % 4 == 3)};
    v[i % 4] += static_cast<float>(i) * 0.01f;
    kernels::normalize_in_place(v);
    storage.insert(storage.end(), v.begin(), v.end());
  }
  index::HnswGraph g(storage, dim, {});
  for (std::uint32_t s = 0; s < 64; ++s) g.add(s);

  const std::vector<float> q(storage.begin() + 5 * dim, storage.begin() + 6 * dim);
  auto hits = g.search(q, 16, {});
  REQUIRE_FALSE(hits.empty());
  REQUIRE(hits.front().first % 4 == 1);

  auto even_only = g.search(q, 16, [](std::uint32_t slot) { return slot % 2 == 0; });
  for (const auto& [slot, sim] : even_only) REQUIRE(slot % 2 == 0);
}

TEST_CASE("empty graph returns nothing", "[index][hnsw]") {
  std::vector<float> storage;
  index::HnswGraph g(storage, 4, {});
  REQUIRE(g.search(std::vector<float>{1, 0, 0, 0}, 10, {}).empty());
  REQUIRE(g.reachable_count_base_layer() == 0);
}
