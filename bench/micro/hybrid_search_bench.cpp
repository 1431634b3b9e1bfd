/** \file hybrid_search_bench.cpp
 *  \brief Micro-benchmarks for dense, sparse and hybrid (RRF) search.
 */

#include <benchmark/benchmark.h>

#include "vectra/collection_manager.hpp"
#include "vectra/index/sparse_index.hpp"
#include "vectra/ingest/ingestion_pipeline.hpp"
#include "vectra/log.hpp"
#include "vectra/search/fusion.hpp"
#include "vectra/search/query_engine.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <random>
#include <vector>

using namespace vectra;

namespace {

constexpr std::size_t kDim = 128;
constexpr std::uint32_t kVocab = 30000;

std::vector<float> random_unit(std::mt19937& gen, std::size_t dim) {
    std::normal_distribution<float> dist(0.0f, 1.0f);
    std::vector<float> v(dim);
    float norm = 0.0f;
    for (auto& x : v) { x = dist(gen); norm += x * x; }
    norm = std::sqrt(norm);
    for (auto& x : v) x /= norm;
    return v;
}

// Zipf-ish term ids so postings lists have realistic skew
SparseVector random_sparse(std::mt19937& gen, std::size_t nnz) {
    std::uniform_real_distribution<double> u(0.0, 1.0);
    std::uniform_real_distribution<float> w(0.1f, 2.0f);
    SparseVector sv;
    for (std::size_t i = 0; i < nnz; ++i) {
        const auto id = static_cast<std::uint32_t>(std::pow(u(gen), 3.0) * kVocab);
        if (std::find(sv.indices.begin(), sv.indices.end(), id) != sv.indices.end()) continue;
        sv.indices.push_back(id);
        sv.values.push_back(w(gen));
    }
    return sv;
}

std::unique_ptr<CollectionManager> build_collection(std::size_t n_docs) {
    set_log_level("warn");
    auto manager = std::make_unique<CollectionManager>(ManagerOptions{});
    (void)manager->create("bench", kDim, DistanceMetric::Cosine);

    std::mt19937 gen(42);
    ingest::InsertManyRequest req;
    req.sparse_vectors.emplace();
    for (std::size_t i = 0; i < n_docs; ++i) {
        req.texts.push_back("doc" + std::to_string(i));
        req.dense_vectors.push_back(random_unit(gen, kDim));
        req.sparse_vectors->push_back(random_sparse(gen, 24));
    }
    ingest::IngestionPipeline pipeline(*manager);
    (void)pipeline.insert_many("bench", std::move(req), 1000);
    return manager;
}

} // namespace

static void BM_SparseIndex_Search(benchmark::State& state) {
    const auto n_docs = static_cast<std::size_t>(state.range(0));
    std::mt19937 gen(7);
    index::SparseIndex idx;
    for (std::size_t i = 0; i < n_docs; ++i) (void)idx.insert(i, random_sparse(gen, 24));
    const auto query = random_sparse(gen, 8);

    for (auto _ : state) {
        auto hits = idx.search(query, 10);
        benchmark::DoNotOptimize(hits);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_SparseIndex_Search)->Range(1000, 100000);

static void BM_RRF_Fusion(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    std::vector<ScoredId> dense, sparse;
    for (std::size_t i = 0; i < n; ++i) {
        dense.push_back(ScoredId{i, 1.0f - static_cast<float>(i) / n});
        sparse.push_back(ScoredId{i * 2, 1.0f - static_cast<float>(i) / n});
    }
    search::ReciprocalRankFusion rrf;

    for (auto _ : state) {
        auto fused = rrf.fuse(dense, sparse, 10);
        benchmark::DoNotOptimize(fused);
    }
    state.SetItemsProcessed(state.iterations() * n * 2);
}
BENCHMARK(BM_RRF_Fusion)->Range(10, 1000);

static void BM_DenseSearch(benchmark::State& state) {
    auto manager = build_collection(static_cast<std::size_t>(state.range(0)));
    search::QueryEngine engine(*manager);
    std::mt19937 gen(9);
    const auto query = random_unit(gen, kDim);

    for (auto _ : state) {
        auto res = engine.search_dense("bench", query, 10);
        benchmark::DoNotOptimize(res);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_DenseSearch)->Range(1000, 20000);

static void BM_HybridSearch(benchmark::State& state) {
    auto manager = build_collection(static_cast<std::size_t>(state.range(0)));
    search::QueryEngine engine(*manager, search::QueryOptions{60.0f, state.range(1) != 0});
    std::mt19937 gen(11);
    const auto dense = random_unit(gen, kDim);
    const auto sparse = random_sparse(gen, 8);

    for (auto _ : state) {
        auto res = engine.search_hybrid("bench", dense, sparse, 50, 50, 10);
        benchmark::DoNotOptimize(res);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_HybridSearch)->ArgsProduct({{1000, 20000}, {0, 1}});

BENCHMARK_MAIN();
