#pragma once

/** \file engine.hpp
 *  \brief Client-facing engine: collection lifecycle, ingestion and search.
 *
 * Mutations return bool, searches std::optional (nullopt = no results or a
 * failure), info std::optional. Failures are logged, never thrown. The
 * typed core is reachable through manager(), queries() and ingestion() for
 * callers that need the error detail.
 *
 * Lifetime: Engine::open acquires the storage root and replays it; the
 * destructor flushes every collection log.
 */

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "vectra/collection_manager.hpp"
#include "vectra/config.hpp"
#include "vectra/error.hpp"
#include "vectra/ingest/ingestion_pipeline.hpp"
#include "vectra/search/query_engine.hpp"
#include "vectra/types.hpp"

namespace vectra {

class Engine {
public:
  /** \brief Validate options, configure logging and restore persisted collections. */
  static auto open(EngineOptions options = {}) -> std::expected<std::unique_ptr<Engine>, core::error>;

  ~Engine();
  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  auto collection_exists(std::string_view name) const -> bool;
  auto list_collections() const -> std::vector<std::string>;

  /** \brief Create with the engine's default metric. */
  auto create_collection(const std::string& name, std::size_t embedding_size, bool do_reset = false) -> bool;
  auto create_collection(const std::string& name, std::size_t embedding_size, DistanceMetric metric,
                         bool do_reset = false) -> bool;
  auto delete_collection(const std::string& name) -> bool;
  auto get_collection_info(std::string_view name) const -> std::optional<CollectionInfo>;

  auto insert_one(std::string_view collection, std::string text, std::vector<float> vector,
                  std::optional<Metadata> metadata = std::nullopt,
                  std::optional<RecordId> record_id = std::nullopt,
                  std::optional<SparseVector> sparse = std::nullopt) -> bool;

  /** \brief batch_size 0 uses EngineOptions::batch_size. */
  auto insert_many(std::string_view collection, ingest::InsertManyRequest request,
                   std::size_t batch_size = 0) -> bool;

  auto search_by_vector(std::string_view collection, std::span<const float> vector,
                        std::size_t limit = 5) const -> std::optional<std::vector<RetrievedDocument>>;

  auto search_hybrid(std::string_view collection, std::span<const float> dense_vector,
                     const SparseVector& sparse_vector, std::size_t dense_limit,
                     std::size_t sparse_limit, std::size_t limit) const
      -> std::optional<std::vector<RetrievedDocument>>;

  auto manager() noexcept -> CollectionManager& { return manager_; }
  auto manager() const noexcept -> const CollectionManager& { return manager_; }
  auto queries() const noexcept -> const search::QueryEngine& { return queries_; }
  auto ingestion() noexcept -> ingest::IngestionPipeline& { return ingestion_; }
  auto options() const noexcept -> const EngineOptions& { return options_; }

private:
  explicit Engine(EngineOptions options);

  EngineOptions options_;
  CollectionManager manager_;
  search::QueryEngine queries_;
  ingest::IngestionPipeline ingestion_;
};

} // namespace vectra
