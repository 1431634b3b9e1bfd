#include <catch2/catch_test_macros.hpp>

#include "vectra/collection.hpp"

#include <limits>

using namespace vectra;

namespace {

// Log that fails every append after `budget` successful ones.
class FailingLog final : public storage::RecordLog {
public:
  explicit FailingLog(int budget) : budget_(budget) {}
  auto append_schema(const CollectionSchema&) -> std::expected<void, core::error> override { return {}; }
  auto append_batch(std::span<const Record>) -> std::expected<void, core::error> override {
    if (budget_-- > 0) return {};
    return core::make_unexpected(core::error_code::io_failed, "disk full", "test.log");
  }
  auto flush() -> std::expected<void, core::error> override { return {}; }

private:
  int budget_;
};

RecordInput input(std::string text, std::vector<float> dense,
                  std::optional<SparseVector> sparse = std::nullopt) {
  RecordInput in;
  in.text = std::move(text);
  in.dense = std::move(dense);
  in.sparse = std::move(sparse);
  return in;
}

} // namespace

TEST_CASE("write_batch assigns ids and makes records searchable", "[collection]") {
  Collection c(CollectionSchema{"c", 2, DistanceMetric::Cosine}, {}, nullptr);
  std::vector<RecordInput> batch{input("a", {1, 0}, SparseVector{{3}, {1.0f}}), input("b", {0, 1})};
  auto ids = c.write_batch(batch);
  REQUIRE(ids.has_value());
  REQUIRE(*ids == std::vector<RecordId>{0, 1});

  auto info = c.info();
  REQUIRE(info.points_count == 2);
  REQUIRE(info.sparse_points_count == 1);
  REQUIRE(info.sparse_dimensions == 1);
  REQUIRE(info.next_id == 2);
  REQUIRE(c.get(0)->text == "a");
  REQUIRE(c.get(1)->dense == std::vector<float>{0, 1});
}

TEST_CASE("invalid records reject the whole batch", "[collection]") {
  Collection c(CollectionSchema{"c", 2, DistanceMetric::Dot}, {}, nullptr);

  std::vector<RecordInput> wrong_dim{input("ok", {1, 0}), input("bad", {1, 0, 0})};
  auto r = c.write_batch(wrong_dim);
  REQUIRE(r.error().code == core::error_code::dimension_mismatch);
  REQUIRE(r.error().message.find("record 1") != std::string::npos);

  std::vector<RecordInput> nan{input("nan", {std::numeric_limits<float>::quiet_NaN(), 0})};
  REQUIRE(c.write_batch(nan).error().code == core::error_code::validation_failed);

  std::vector<RecordInput> bad_sparse{input("s", {1, 0}, SparseVector{{1, 1}, {1.0f, 1.0f}})};
  REQUIRE(c.write_batch(bad_sparse).error().code == core::error_code::validation_failed);

  REQUIRE(c.info().points_count == 0);
}

TEST_CASE("a failed log append leaves the collection unchanged", "[collection]") {
  Collection c(CollectionSchema{"c", 2, DistanceMetric::Dot}, {}, std::make_unique<FailingLog>(1));
  std::vector<RecordInput> first{input("a", {1, 0})};
  REQUIRE(c.write_batch(first).has_value());

  std::vector<RecordInput> second{input("b", {0, 1})};
  auto r = c.write_batch(second);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::transient_write);
  REQUIRE(c.info().points_count == 1);
  REQUIRE(c.info().next_id == 1);
}

TEST_CASE("upserts replace text, vectors and sparse postings", "[collection]") {
  Collection c(CollectionSchema{"c", 2, DistanceMetric::Dot}, {}, nullptr);
  RecordInput a = input("v1", {1, 0}, SparseVector{{1}, {1.0f}});
  a.id = 9;
  REQUIRE(c.write_batch(std::span<const RecordInput>(&a, 1)).has_value());

  RecordInput b = input("v2", {0, 1});
  b.id = 9;
  REQUIRE(c.write_batch(std::span<const RecordInput>(&b, 1)).has_value());

  auto info = c.info();
  REQUIRE(info.points_count == 1);
  REQUIRE(info.sparse_points_count == 0);
  REQUIRE(c.get(9)->text == "v2");
  REQUIRE(c.dense().size() == 1);
}

TEST_CASE("writes to a dropped collection fail with not_found", "[collection]") {
  Collection c(CollectionSchema{"c", 2, DistanceMetric::Dot}, {}, nullptr);
  {
    auto lock = c.lock_exclusive();
    c.mark_dropped();
  }
  std::vector<RecordInput> batch{input("a", {1, 0})};
  REQUIRE(c.write_batch(batch).error().code == core::error_code::not_found);
}
