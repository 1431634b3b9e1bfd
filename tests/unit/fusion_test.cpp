/** \file fusion_test.cpp
 *  \brief Reciprocal Rank Fusion ordering, scores and tie-breaks.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "vectra/search/fusion.hpp"

using namespace vectra;
using namespace vectra::search;
using Catch::Matchers::WithinRel;

namespace {

constexpr RecordId A = 1, B = 2, C = 3, D = 4;

std::vector<ScoredId> ranked(std::initializer_list<RecordId> ids) {
  std::vector<ScoredId> out;
  float score = 1.0f;
  for (RecordId id : ids) {
    out.push_back(ScoredId{id, score});
    score -= 0.1f;
  }
  return out;
}

} // namespace

TEST_CASE("records in both lists rise to the top", "[fusion]") {
  ReciprocalRankFusion rrf(60.0f);
  auto fused = rrf.fuse(ranked({A, B, C}), ranked({B, D, A}), 10);
  REQUIRE(fused.size() == 4);
  REQUIRE(fused[0].id == B);
  REQUIRE(fused[1].id == A);
  REQUIRE(fused[2].id == D);
  REQUIRE(fused[3].id == C);

  REQUIRE_THAT(fused[0].fused_score, WithinRel(1.0f / 62.0f + 1.0f / 61.0f, 1e-6f));
  REQUIRE(fused[0].dense_rank == 2);
  REQUIRE(fused[0].sparse_rank == 1);
  REQUIRE(fused[2].dense_rank == 0);
  REQUIRE(fused[2].best_rank() == 2);
}

TEST_CASE("fusion truncates to top_k", "[fusion]") {
  ReciprocalRankFusion rrf;
  REQUIRE(rrf.fuse(ranked({A, B, C}), ranked({B, D, A}), 2).size() == 2);
  REQUIRE(rrf.fuse(ranked({A}), {}, 0).empty());
}

TEST_CASE("one empty list degrades to the other list's order", "[fusion]") {
  ReciprocalRankFusion rrf;
  auto fused = rrf.fuse({}, ranked({C, A, B}), 10);
  REQUIRE(fused.size() == 3);
  REQUIRE(fused[0].id == C);
  REQUIRE(fused[1].id == A);
  REQUIRE(fused[2].id == B);
  REQUIRE(rrf.fuse({}, {}, 10).empty());
}

TEST_CASE("equal fused scores fall back to best rank then id", "[fusion]") {
  ReciprocalRankFusion rrf;
  auto fused = rrf.fuse(ranked({D}), ranked({B}), 10);
  REQUIRE(fused.size() == 2);
  REQUIRE(fused[0].fused_score == fused[1].fused_score);
  REQUIRE(fused[0].id == B);
  REQUIRE(fused[1].id == D);
}

TEST_CASE("duplicate ids keep their first rank", "[fusion]") {
  ReciprocalRankFusion rrf;
  auto fused = rrf.fuse(ranked({A, B, A}), {}, 10);
  REQUIRE(fused.size() == 2);
  REQUIRE(fused[0].id == A);
  REQUIRE(fused[0].dense_rank == 1);
}

TEST_CASE("smaller k sharpens the gap between ranks", "[fusion]") {
  ReciprocalRankFusion rrf(1.0f);
  REQUIRE(rrf.score(1, 0) == 0.5f);
  REQUIRE(rrf.score(1, 1) == 1.0f);
  rrf.set_k(60.0f);
  REQUIRE(rrf.k() == 60.0f);
  REQUIRE(rrf.score(0, 0) == 0.0f);
}
