#include "vectra/engine.hpp"
#include "vectra/log.hpp"

namespace vectra {

namespace {

auto report(std::string_view op, const core::error& err) -> void {
  logger()->error("[engine] {} failed: {} ({}, {})", op, err.message,
                  core::to_string(err.code), err.component);
}

} // namespace

Engine::Engine(EngineOptions options)
    : options_(std::move(options)),
      manager_(ManagerOptions{options_.storage_root, options_.dense, options_.fsync_on_write}),
      queries_(manager_, search::QueryOptions{options_.rrf_k, options_.parallel_prefetch}),
      ingestion_(manager_) {}

auto Engine::open(EngineOptions options) -> std::expected<std::unique_ptr<Engine>, core::error> {
  if (auto ok = validate_options(options); !ok) return std::unexpected(ok.error());
  set_log_level(options.log_level);

  std::unique_ptr<Engine> engine(new Engine(std::move(options)));
  if (auto restored = engine->manager_.open(); !restored) {
    return std::unexpected(restored.error());
  }
  logger()->info("[engine] opened ({}; metric={})",
                 engine->options_.storage_root.empty() ? std::string("in-memory")
                                                       : engine->options_.storage_root,
                 to_string(engine->options_.distance_metric));
  return engine;
}

Engine::~Engine() {
  if (auto ok = manager_.flush(); !ok) report("flush on close", ok.error());
}

auto Engine::collection_exists(std::string_view name) const -> bool {
  return manager_.exists(name);
}

auto Engine::list_collections() const -> std::vector<std::string> {
  return manager_.list();
}

auto Engine::create_collection(const std::string& name, std::size_t embedding_size, bool do_reset) -> bool {
  return create_collection(name, embedding_size, options_.distance_metric, do_reset);
}

auto Engine::create_collection(const std::string& name, std::size_t embedding_size,
                               DistanceMetric metric, bool do_reset) -> bool {
  auto created = manager_.create(name, embedding_size, metric, do_reset);
  if (!created) {
    report("create_collection", created.error());
    return false;
  }
  return *created;
}

auto Engine::delete_collection(const std::string& name) -> bool {
  auto removed = manager_.remove(name);
  if (!removed) {
    report("delete_collection", removed.error());
    return false;
  }
  return *removed;
}

auto Engine::get_collection_info(std::string_view name) const -> std::optional<CollectionInfo> {
  auto info = manager_.info(name);
  if (!info) {
    report("get_collection_info", info.error());
    return std::nullopt;
  }
  return *info;
}

auto Engine::insert_one(std::string_view collection, std::string text, std::vector<float> vector,
                        std::optional<Metadata> metadata, std::optional<RecordId> record_id,
                        std::optional<SparseVector> sparse) -> bool {
  auto id = ingestion_.insert_one(collection, std::move(text), std::move(vector), std::move(metadata),
                                  record_id, std::move(sparse));
  if (!id) {
    report("insert_one", id.error());
    return false;
  }
  return true;
}

auto Engine::insert_many(std::string_view collection, ingest::InsertManyRequest request,
                         std::size_t batch_size) -> bool {
  auto result = ingestion_.insert_many(collection, std::move(request),
                                       batch_size == 0 ? options_.batch_size : batch_size);
  if (!result) {
    report("insert_many", result.error());
    return false;
  }
  if (!result->ok()) {
    report("insert_many", *result->failure);
    return false;
  }
  return true;
}

auto Engine::search_by_vector(std::string_view collection, std::span<const float> vector,
                              std::size_t limit) const -> std::optional<std::vector<RetrievedDocument>> {
  auto result = queries_.search_dense(collection, vector, limit);
  if (!result) {
    report("search_by_vector", result.error());
    return std::nullopt;
  }
  return std::move(*result);
}

auto Engine::search_hybrid(std::string_view collection, std::span<const float> dense_vector,
                           const SparseVector& sparse_vector, std::size_t dense_limit,
                           std::size_t sparse_limit, std::size_t limit) const
    -> std::optional<std::vector<RetrievedDocument>> {
  auto result = queries_.search_hybrid(collection, dense_vector, sparse_vector, dense_limit,
                                       sparse_limit, limit);
  if (!result) {
    report("search_hybrid", result.error());
    return std::nullopt;
  }
  return std::move(*result);
}

} // namespace vectra
