#include "vectra/search/query_engine.hpp"
#include "vectra/log.hpp"
#include "vectra/search/fusion.hpp"

#include <future>
#include <system_error>

namespace vectra::search {

namespace {

auto resolve(const Collection& collection, const std::vector<ScoredId>& hits) -> SearchResult {
  std::vector<RetrievedDocument> docs;
  docs.reserve(hits.size());
  for (const auto& hit : hits) {
    const Record* rec = collection.records().find(hit.id);
    if (!rec) continue;
    docs.push_back(RetrievedDocument{hit.score, rec->text, hit.id});
  }
  if (docs.empty()) return std::nullopt;
  return docs;
}

auto compile_filter(const Collection& collection, const filter_expr* filter)
    -> std::optional<roaring::Roaring64Map> {
  if (!filter) return std::nullopt;
  return collection.records().select(*filter);
}

} // namespace

QueryEngine::QueryEngine(const CollectionManager& manager, QueryOptions options)
    : manager_(manager), options_(options) {}

auto QueryEngine::search_dense(std::string_view collection, std::span<const float> vector,
                               std::size_t limit, const filter_expr* filter) const
    -> std::expected<SearchResult, core::error> {
  auto coll = manager_.get(collection);
  if (!coll) return std::unexpected(coll.error());
  const Collection& c = **coll;

  auto lock = c.lock_shared();
  const auto allowed = compile_filter(c, filter);
  auto hits = c.dense().search(vector, limit, allowed ? &*allowed : nullptr);
  if (!hits) return std::unexpected(hits.error());
  return resolve(c, *hits);
}

auto QueryEngine::search_sparse(std::string_view collection, const SparseVector& vector,
                                std::size_t limit, const filter_expr* filter) const
    -> std::expected<SearchResult, core::error> {
  auto coll = manager_.get(collection);
  if (!coll) return std::unexpected(coll.error());
  const Collection& c = **coll;

  auto lock = c.lock_shared();
  const auto allowed = compile_filter(c, filter);
  auto hits = c.sparse().search(vector, limit, allowed ? &*allowed : nullptr);
  if (!hits) return std::unexpected(hits.error());
  return resolve(c, *hits);
}

auto QueryEngine::search_hybrid(std::string_view collection, std::span<const float> dense_vector,
                                const SparseVector& sparse_vector, std::size_t dense_limit,
                                std::size_t sparse_limit, std::size_t limit,
                                const filter_expr* filter) const
    -> std::expected<SearchResult, core::error> {
  auto coll = manager_.get(collection);
  if (!coll) return std::unexpected(coll.error());
  const Collection& c = **coll;

  if (auto ok = c.dense().check_vector(dense_vector); !ok) return std::unexpected(ok.error());
  if (auto ok = sparse_vector.validate(); !ok) return std::unexpected(ok.error());

  auto lock = c.lock_shared();
  const auto allowed = compile_filter(c, filter);
  const roaring::Roaring64Map* allow = allowed ? &*allowed : nullptr;

  auto dense_prefetch = [&]() { return c.dense().search(dense_vector, dense_limit, allow); };
  auto sparse_prefetch = [&]() { return c.sparse().search(sparse_vector, sparse_limit, allow); };

  std::expected<std::vector<ScoredId>, core::error> dense_hits;
  std::expected<std::vector<ScoredId>, core::error> sparse_hits;
  bool prefetched = false;
  if (options_.parallel_prefetch) {
    try {
      auto sparse_future = std::async(std::launch::async, sparse_prefetch);
      dense_hits = dense_prefetch();
      sparse_hits = sparse_future.get();
      prefetched = true;
    } catch (const std::system_error& e) {
      logger()->warn("[query] parallel prefetch unavailable, running sequentially: {}", e.what());
    }
  }
  if (!prefetched) {
    dense_hits = dense_prefetch();
    sparse_hits = sparse_prefetch();
  }
  if (!dense_hits) return std::unexpected(dense_hits.error());
  if (!sparse_hits) return std::unexpected(sparse_hits.error());

  const ReciprocalRankFusion rrf(options_.rrf_k);
  const auto fused = rrf.fuse(*dense_hits, *sparse_hits, limit);
  logger()->trace("[query] hybrid '{}': dense={} sparse={} fused={}", c.name(),
                  dense_hits->size(), sparse_hits->size(), fused.size());

  std::vector<ScoredId> ranked;
  ranked.reserve(fused.size());
  for (const auto& f : fused) ranked.push_back(ScoredId{f.id, f.fused_score});
  return resolve(c, ranked);
}

} // namespace vectra::search
