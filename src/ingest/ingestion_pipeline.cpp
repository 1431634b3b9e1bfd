#include "vectra/ingest/ingestion_pipeline.hpp"
#include "vectra/log.hpp"

#include <algorithm>

namespace vectra::ingest {

namespace {

auto check_length(const char* what, std::size_t got, std::size_t expected)
    -> std::expected<void, core::error> {
  if (got == expected) return {};
  return core::make_unexpected(core::error_code::validation_failed,
                               std::string(what) + " has " + std::to_string(got) +
                                   " entries, expected " + std::to_string(expected),
                               "ingest");
}

} // namespace

auto IngestionPipeline::insert_one(std::string_view collection, std::string text,
                                   std::vector<float> vector, std::optional<Metadata> metadata,
                                   std::optional<RecordId> record_id,
                                   std::optional<SparseVector> sparse)
    -> std::expected<RecordId, core::error> {
  auto coll = manager_.get(collection);
  if (!coll) return std::unexpected(coll.error());

  RecordInput input{record_id, std::move(text), std::move(metadata), std::move(vector), std::move(sparse)};
  auto ids = (*coll)->write_batch(std::span<const RecordInput>(&input, 1));
  if (!ids) return std::unexpected(ids.error());
  return ids->front();
}

auto IngestionPipeline::insert_many(std::string_view collection, InsertManyRequest request,
                                    std::size_t batch_size)
    -> std::expected<BatchReport, core::error> {
  if (batch_size == 0) {
    return core::make_unexpected(core::error_code::validation_failed,
                                 "batch_size must be positive", "ingest");
  }
  const std::size_t n = request.texts.size();
  if (auto ok = check_length("dense_vectors", request.dense_vectors.size(), n); !ok) {
    return std::unexpected(ok.error());
  }
  if (request.sparse_vectors) {
    if (auto ok = check_length("sparse_vectors", request.sparse_vectors->size(), n); !ok) {
      return std::unexpected(ok.error());
    }
  }
  if (request.metadata) {
    if (auto ok = check_length("metadata", request.metadata->size(), n); !ok) {
      return std::unexpected(ok.error());
    }
  }
  if (request.record_ids) {
    if (auto ok = check_length("record_ids", request.record_ids->size(), n); !ok) {
      return std::unexpected(ok.error());
    }
  }

  auto coll = manager_.get(collection);
  if (!coll) return std::unexpected(coll.error());

  BatchReport report;
  report.ids.reserve(n);
  std::vector<RecordInput> batch;
  batch.reserve(std::min(batch_size, n));

  for (std::size_t start = 0; start < n; start += batch_size) {
    const std::size_t end = std::min(n, start + batch_size);
    batch.clear();
    for (std::size_t i = start; i < end; ++i) {
      RecordInput in;
      if (request.record_ids) in.id = (*request.record_ids)[i];
      in.text = std::move(request.texts[i]);
      if (request.metadata) in.metadata = std::move((*request.metadata)[i]);
      in.dense = std::move(request.dense_vectors[i]);
      if (request.sparse_vectors) in.sparse = std::move((*request.sparse_vectors)[i]);
      batch.push_back(std::move(in));
    }

    auto ids = (*coll)->write_batch(batch);
    if (!ids) {
      auto err = ids.error();
      err.message = "batch " + std::to_string(report.batches_committed) + " (records " +
                    std::to_string(start) + "-" + std::to_string(end - 1) + "): " + err.message;
      logger()->error("[ingest] {}: {} ({} batch(es) committed)", collection, err.message,
                      report.batches_committed);
      report.failure = std::move(err);
      return report;
    }
    report.ids.insert(report.ids.end(), ids->begin(), ids->end());
    report.records_committed += ids->size();
    ++report.batches_committed;
    logger()->debug("[ingest] {}: batch {} committed ({} records)", collection,
                    report.batches_committed, ids->size());
  }
  return report;
}

} // namespace vectra::ingest
