#include <catch2/catch_test_macros.hpp>

#include "vectra/ingest/ingestion_pipeline.hpp"

using namespace vectra;
using ingest::InsertManyRequest;

namespace {

InsertManyRequest request_of(std::size_t n, std::size_t dim) {
  InsertManyRequest req;
  for (std::size_t i = 0; i < n; ++i) {
    req.texts.push_back("doc " + std::to_string(i));
    std::vector<float> v(dim, 0.0f);
    v[i % dim] = 1.0f;
    req.dense_vectors.push_back(std::move(v));
  }
  return req;
}

} // namespace

TEST_CASE("insert_many commits every batch in order", "[ingest]") {
  CollectionManager m(ManagerOptions{});
  REQUIRE(m.create("c", 4, DistanceMetric::Cosine).value());
  ingest::IngestionPipeline pipeline(m);

  auto report = pipeline.insert_many("c", request_of(120, 4), 50);
  REQUIRE(report.has_value());
  REQUIRE(report->ok());
  REQUIRE(report->batches_committed == 3);
  REQUIRE(report->records_committed == 120);
  REQUIRE(report->ids.front() == 0);
  REQUIRE(report->ids.back() == 119);
  REQUIRE(m.info("c")->points_count == 120);
}

TEST_CASE("a bad record fails its batch and keeps earlier batches", "[ingest]") {
  CollectionManager m(ManagerOptions{});
  REQUIRE(m.create("c", 4, DistanceMetric::Cosine).value());
  ingest::IngestionPipeline pipeline(m);

  auto req = request_of(100, 4);
  req.dense_vectors[75] = {1.0f, 2.0f};
  auto report = pipeline.insert_many("c", std::move(req), 50);
  REQUIRE(report.has_value());
  REQUIRE_FALSE(report->ok());
  REQUIRE(report->failure->code == core::error_code::dimension_mismatch);
  REQUIRE(report->batches_committed == 1);
  REQUIRE(report->records_committed == 50);
  REQUIRE(report->ids.size() == 50);
  REQUIRE(report->ids.back() == 49);

  auto info = m.info("c");
  REQUIRE(info->points_count == 50);
  REQUIRE(info->next_id == 50);
}

TEST_CASE("parallel arrays must agree in length", "[ingest]") {
  CollectionManager m(ManagerOptions{});
  REQUIRE(m.create("c", 2, DistanceMetric::Dot).value());
  ingest::IngestionPipeline pipeline(m);

  auto req = request_of(3, 2);
  req.dense_vectors.pop_back();
  REQUIRE(pipeline.insert_many("c", req).error().code == core::error_code::validation_failed);

  auto md = request_of(3, 2);
  md.metadata = std::vector<std::optional<Metadata>>(2);
  REQUIRE(pipeline.insert_many("c", md).error().code == core::error_code::validation_failed);

  REQUIRE(pipeline.insert_many("c", request_of(3, 2), 0).error().code ==
          core::error_code::validation_failed);
  REQUIRE(m.info("c")->points_count == 0);
}

TEST_CASE("unknown collections are not_found", "[ingest]") {
  CollectionManager m(ManagerOptions{});
  ingest::IngestionPipeline pipeline(m);
  REQUIRE(pipeline.insert_many("missing", request_of(1, 2)).error().code == core::error_code::not_found);
  REQUIRE(pipeline.insert_one("missing", "t", {1.0f, 0.0f}).error().code == core::error_code::not_found);
}

TEST_CASE("caller ids, metadata and sparse vectors flow through", "[ingest]") {
  CollectionManager m(ManagerOptions{});
  REQUIRE(m.create("c", 2, DistanceMetric::Dot).value());
  ingest::IngestionPipeline pipeline(m);

  auto req = request_of(2, 2);
  req.record_ids = std::vector<RecordId>{100, 7};
  req.metadata = std::vector<std::optional<Metadata>>{Metadata{{"k", std::string("v")}}, std::nullopt};
  req.sparse_vectors = std::vector<std::optional<SparseVector>>{std::nullopt, SparseVector{{5}, {1.0f}}};
  auto report = pipeline.insert_many("c", std::move(req));
  REQUIRE(report->ok());
  REQUIRE(report->ids == std::vector<RecordId>{100, 7});

  auto c = m.get("c").value();
  REQUIRE(c->get(100)->metadata.has_value());
  REQUIRE(c->get(7)->sparse.has_value());
  REQUIRE(c->info().next_id == 101);

  auto id = pipeline.insert_one("c", "next", {0.0f, 1.0f});
  REQUIRE(id.value() == 101);
}
