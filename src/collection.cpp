#include "vectra/collection.hpp"
#include "vectra/log.hpp"

#include <string>

namespace vectra {

Collection::Collection(CollectionSchema schema, const index::DenseIndexParams& dense_params,
                       std::unique_ptr<storage::RecordLog> log)
    : schema_(std::move(schema)),
      dense_(schema_.dimension, schema_.metric, dense_params),
      log_(log ? std::move(log) : std::make_unique<storage::NullRecordLog>()) {}

auto Collection::validate(std::span<const RecordInput> inputs) const -> std::expected<void, core::error> {
  for (std::size_t i = 0; i < inputs.size(); ++i) {
    const auto& in = inputs[i];
    if (auto ok = dense_.check_vector(in.dense); !ok) {
      auto err = ok.error();
      err.message = "record " + std::to_string(i) + ": " + err.message;
      return std::unexpected(std::move(err));
    }
    if (in.sparse) {
      if (auto ok = in.sparse->validate(); !ok) {
        auto err = ok.error();
        err.message = "record " + std::to_string(i) + ": " + err.message;
        return std::unexpected(std::move(err));
      }
    }
  }
  return {};
}

auto Collection::to_records(std::span<const RecordInput> inputs, const std::vector<RecordId>& ids) const
    -> std::vector<Record> {
  std::vector<Record> out;
  out.reserve(inputs.size());
  for (std::size_t i = 0; i < inputs.size(); ++i) {
    Record r;
    r.id = ids[i];
    r.text = inputs[i].text;
    r.metadata = inputs[i].metadata;
    r.dense = inputs[i].dense;
    if (inputs[i].sparse) r.sparse = inputs[i].sparse->compacted();
    out.push_back(std::move(r));
  }
  return out;
}

auto Collection::apply(std::vector<Record> records) -> std::expected<void, core::error> {
  for (const auto& r : records) {
    if (auto ok = dense_.insert(r.id, r.dense); !ok) return ok;
    if (r.sparse && !r.sparse->empty()) {
      if (auto ok = sparse_.insert(r.id, *r.sparse); !ok) return ok;
    } else {
      sparse_.erase(r.id);
    }
  }
  records_.put_batch(std::move(records));
  return {};
}

auto Collection::write_batch(std::span<const RecordInput> inputs)
    -> std::expected<std::vector<RecordId>, core::error> {
  if (auto ok = validate(inputs); !ok) return std::unexpected(ok.error());

  std::unique_lock lock(mutex_);
  if (dropped_) {
    return core::make_unexpected(core::error_code::not_found,
                                 "collection '" + schema_.name + "' was deleted", "collection");
  }
  auto ids = records_.plan_ids(inputs);
  auto records = to_records(inputs, ids);

  if (auto logged = log_->append_batch(records); !logged) {
    logger()->warn("[collection] {}: log append failed: {}", schema_.name, logged.error().message);
    return core::make_unexpected(core::error_code::transient_write,
                                 "batch write failed: " + logged.error().message, "collection");
  }
  if (auto ok = apply(std::move(records)); !ok) return std::unexpected(ok.error());
  return ids;
}

auto Collection::apply_replayed(std::vector<Record> records) -> std::expected<void, core::error> {
  std::unique_lock lock(mutex_);
  for (const auto& r : records) {
    if (r.dense.size() != schema_.dimension) {
      return core::make_unexpected(core::error_code::data_integrity,
                                   "replayed record " + std::to_string(r.id) + " has wrong dimension",
                                   "collection");
    }
  }
  return apply(std::move(records));
}

auto Collection::attach_log(std::unique_ptr<storage::RecordLog> log) -> void {
  std::unique_lock lock(mutex_);
  log_ = log ? std::move(log) : std::make_unique<storage::NullRecordLog>();
}

auto Collection::mark_dropped() -> void {
  dropped_ = true;
  log_ = std::make_unique<storage::NullRecordLog>();
}

auto Collection::info() const -> CollectionInfo {
  std::shared_lock lock(mutex_);
  return CollectionInfo{schema_.name, schema_.dimension, schema_.metric,
                        records_.size(), sparse_.size(), sparse_.dimensions(),
                        records_.next_id()};
}

auto Collection::get(RecordId id) const -> std::expected<Record, core::error> {
  std::shared_lock lock(mutex_);
  return records_.get(id);
}

auto Collection::flush() -> std::expected<void, core::error> {
  std::unique_lock lock(mutex_);
  return log_->flush();
}

} // namespace vectra
