#include "vectra/storage/record_store.hpp"
#include "vectra/filter/filter_eval.hpp"

#include <limits>
#include <string>

namespace vectra::storage {

auto RecordStore::plan_ids(std::span<const RecordInput> inputs) const -> std::vector<RecordId> {
  std::vector<RecordId> ids;
  ids.reserve(inputs.size());
  RecordId next = next_id_;
  for (const auto& in : inputs) {
    if (in.id) {
      ids.push_back(*in.id);
      if (*in.id >= next && *in.id != std::numeric_limits<RecordId>::max()) next = *in.id + 1;
    } else {
      ids.push_back(next++);
    }
  }
  return ids;
}

auto RecordStore::bump(RecordId id) noexcept -> void {
  if (id >= next_id_ && id != std::numeric_limits<RecordId>::max()) next_id_ = id + 1;
}

auto RecordStore::put(Record record) -> RecordId {
  const RecordId id = record.id;
  bump(id);
  records_.insert_or_assign(id, std::move(record));
  return id;
}

auto RecordStore::put_batch(std::vector<Record> records) -> void {
  for (auto& r : records) put(std::move(r));
}

auto RecordStore::get(RecordId id) const -> std::expected<Record, core::error> {
  auto it = records_.find(id);
  if (it == records_.end()) {
    return core::make_unexpected(core::error_code::not_found,
                                 "record " + std::to_string(id) + " not found",
                                 "storage.records");
  }
  return it->second;
}

auto RecordStore::find(RecordId id) const -> const Record* {
  auto it = records_.find(id);
  return it == records_.end() ? nullptr : &it->second;
}

auto RecordStore::select(const filter_expr& expr) const -> roaring::Roaring64Map {
  roaring::Roaring64Map ids;
  for (const auto& [id, rec] : records_) {
    if (filter_eval::matches(expr, rec.metadata)) ids.add(id);
  }
  return ids;
}

} // namespace vectra::storage
