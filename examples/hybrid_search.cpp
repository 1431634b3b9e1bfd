/**
 * Hybrid search example using Vectra
 *
 * Creates a collection, ingests a few documents with dense embeddings and
 * sparse term weights, then compares dense-only and hybrid (RRF) rankings.
 * Pass a directory as the first argument to persist the collection.
 */

#include <vectra/vectra.hpp>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    using namespace vectra;

    auto options = options_from_env();
    if (!options) {
        std::cerr << "Invalid configuration: " << options.error().message << std::endl;
        return 1;
    }
    if (argc > 1) options->storage_root = argv[1];

    auto opened = Engine::open(*options);
    if (!opened) {
        std::cerr << "Failed to open engine: " << opened.error().message << std::endl;
        return 1;
    }
    auto& engine = **opened;

    if (!engine.create_collection("articles", 4, true)) return 1;

    // Toy vocabulary: 0 = "rust", 1 = "memory", 2 = "safety", 3 = "garbage", 4 = "collector"
    ingest::InsertManyRequest req;
    req.texts = {
        "Ownership gives memory safety without a garbage collector",
        "Tuning the garbage collector of a managed runtime",
        "Borrow checking in practice",
        "Memory safety bugs in legacy code",
    };
    req.dense_vectors = {
        {0.9f, 0.1f, 0.0f, 0.1f},
        {0.1f, 0.9f, 0.1f, 0.0f},
        {0.8f, 0.0f, 0.3f, 0.2f},
        {0.3f, 0.2f, 0.9f, 0.0f},
    };
    req.sparse_vectors = std::vector<std::optional<SparseVector>>{
        SparseVector{{1, 2, 3, 4}, {0.6f, 0.8f, 0.4f, 0.4f}},
        SparseVector{{3, 4}, {1.2f, 1.2f}},
        std::nullopt,
        SparseVector{{1, 2}, {1.0f, 1.1f}},
    };
    req.metadata = std::vector<std::optional<Metadata>>{
        Metadata{{"year", std::int64_t{2021}}},
        Metadata{{"year", std::int64_t{2019}}},
        Metadata{{"year", std::int64_t{2023}}},
        std::nullopt,
    };
    if (!engine.insert_many("articles", std::move(req))) return 1;

    const std::vector<float> query{0.85f, 0.05f, 0.3f, 0.1f};
    const SparseVector terms{{1, 2}, {1.0f, 1.0f}};  // "memory safety"

    auto print = [](const char* title, const auto& docs) {
        std::cout << title << std::endl;
        if (!docs) {
            std::cout << "  (no results)" << std::endl;
            return;
        }
        for (const auto& d : *docs) {
            std::cout << "  [" << d.id << "] " << d.score << "  " << d.text << std::endl;
        }
    };

    print("Dense only:", engine.search_by_vector("articles", query, 3));
    print("Hybrid (RRF):", engine.search_hybrid("articles", query, terms, 10, 10, 3));

    // Payload filters are available on the query engine directly
    const auto recent = between("year", 2020, 2030);
    auto filtered = engine.queries().search_hybrid("articles", query, terms, 10, 10, 3, &recent);
    if (!filtered) {
        std::cerr << "Search failed: " << filtered.error().message << std::endl;
        return 1;
    }
    print("Hybrid, year >= 2020:", *filtered);

    if (auto info = engine.get_collection_info("articles")) {
        std::cout << info->points_count << " points, " << info->sparse_dimensions
                  << " sparse dimensions" << std::endl;
    }
    return 0;
}
