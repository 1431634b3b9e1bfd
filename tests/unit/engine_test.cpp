#include <catch2/catch_test_macros.hpp>

#include "vectra/vectra.hpp"
#include "../support/temp_dir.hpp"

using namespace vectra;

namespace {

auto open_in_memory() -> std::unique_ptr<Engine> {
  EngineOptions opts;
  opts.log_level = "off";
  auto engine = Engine::open(opts);
  REQUIRE(engine.has_value());
  return std::move(*engine);
}

} // namespace

TEST_CASE("engine rejects invalid options", "[engine]") {
  EngineOptions opts;
  opts.batch_size = 0;
  auto engine = Engine::open(opts);
  REQUIRE_FALSE(engine.has_value());
  REQUIRE(engine.error().code == core::error_code::config_invalid);
}

TEST_CASE("collection lifecycle through the engine", "[engine]") {
  auto engine = open_in_memory();
  REQUIRE(engine->create_collection("docs", 3));
  REQUIRE_FALSE(engine->create_collection("docs", 3));
  REQUIRE(engine->create_collection("docs", 3, true));
  REQUIRE(engine->create_collection("dots", 3, DistanceMetric::Dot));
  REQUIRE_FALSE(engine->create_collection("bad name", 3));
  REQUIRE(engine->collection_exists("docs"));
  REQUIRE(engine->list_collections() == std::vector<std::string>{"docs", "dots"});

  auto info = engine->get_collection_info("docs");
  REQUIRE(info.has_value());
  REQUIRE(info->metric == DistanceMetric::Cosine);
  REQUIRE(engine->get_collection_info("dots")->metric == DistanceMetric::Dot);
  REQUIRE_FALSE(engine->get_collection_info("missing").has_value());

  REQUIRE(engine->delete_collection("dots"));
  REQUIRE_FALSE(engine->delete_collection("dots"));
  REQUIRE_FALSE(engine->collection_exists("dots"));
}

TEST_CASE("engine ingestion and search", "[engine]") {
  auto engine = open_in_memory();
  REQUIRE(engine->create_collection("docs", 2));

  REQUIRE(engine->insert_one("docs", "first", {1.0f, 0.0f}, std::nullopt, std::nullopt,
                             SparseVector{{7}, {1.0f}}));
  REQUIRE_FALSE(engine->insert_one("docs", "wrong", {1.0f}));
  REQUIRE_FALSE(engine->insert_one("missing", "x", {1.0f, 0.0f}));

  ingest::InsertManyRequest req;
  req.texts = {"second", "third"};
  req.dense_vectors = {{0.0f, 1.0f}, {0.7f, 0.7f}};
  REQUIRE(engine->insert_many("docs", std::move(req)));

  ingest::InsertManyRequest bad;
  bad.texts = {"only text"};
  REQUIRE_FALSE(engine->insert_many("docs", std::move(bad)));

  std::vector<float> q{1.0f, 0.0f};
  auto hits = engine->search_by_vector("docs", q, 2);
  REQUIRE(hits.has_value());
  REQUIRE(hits->size() == 2);
  REQUIRE(hits->front().text == "first");
  REQUIRE((*hits)[1].text == "third");

  auto fused = engine->search_hybrid("docs", q, SparseVector{{7}, {1.0f}}, 5, 5, 1);
  REQUIRE(fused.has_value());
  REQUIRE(fused->size() == 1);
  REQUIRE(fused->front().text == "first");

  REQUIRE_FALSE(engine->search_by_vector("missing", q).has_value());
  REQUIRE_FALSE(engine->search_by_vector("docs", std::vector<float>{1.0f}).has_value());
  REQUIRE(engine->get_collection_info("docs")->points_count == 3);
}

TEST_CASE("engine reopens persisted collections", "[engine][persistence]") {
  test::TempDir dir("vectra_engine_persist");
  EngineOptions opts;
  opts.storage_root = dir.path().string();
  opts.log_level = "off";
  {
    auto engine = Engine::open(opts);
    REQUIRE(engine.has_value());
    REQUIRE((*engine)->create_collection("docs", 2));
    REQUIRE((*engine)->insert_one("docs", "kept", {1.0f, 0.0f}));
  }
  auto engine = Engine::open(opts);
  REQUIRE(engine.has_value());
  REQUIRE((*engine)->collection_exists("docs"));
  std::vector<float> q{1.0f, 0.0f};
  auto hits = (*engine)->search_by_vector("docs", q);
  REQUIRE(hits.has_value());
  REQUIRE(hits->front().text == "kept");
}
