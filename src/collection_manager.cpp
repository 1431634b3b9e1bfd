#include "vectra/collection_manager.hpp"
#include "vectra/log.hpp"
#include "vectra/storage/record_log.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <system_error>

namespace vectra {

namespace fs = std::filesystem;

CollectionManager::CollectionManager(ManagerOptions options) : options_(std::move(options)) {}

auto CollectionManager::validate_name(std::string_view name) -> std::expected<void, core::error> {
  auto fail = [&name](const char* why) {
    return core::make_unexpected(core::error_code::validation_failed,
                                 "invalid collection name '" + std::string(name) + "': " + why,
                                 "collection.manager");
  };
  if (name.empty() || name.size() > 255) return fail("length must be 1-255");
  if (name == "." || name == "..") return fail("reserved name");
  for (char c : name) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                    c == '_' || c == '-' || c == '.';
    if (!ok) return fail("allowed characters are [A-Za-z0-9_.-]");
  }
  return {};
}

auto CollectionManager::collection_dir(const std::string& name) const -> fs::path {
  return options_.storage_root / name;
}

auto CollectionManager::restore(const fs::path& dir) -> std::expected<std::shared_ptr<Collection>, core::error> {
  const std::string dir_name = dir.filename().string();
  const fs::path log_path = dir / kCollectionLogFile;
  std::shared_ptr<Collection> collection;

  storage::ReplayVisitor visitor{
      [&](const CollectionSchema& schema) -> std::expected<void, core::error> {
        if (schema.name != dir_name || schema.dimension == 0) {
          return core::make_unexpected(core::error_code::data_integrity,
                                       "schema does not match directory '" + dir_name + "'",
                                       "collection.manager");
        }
        collection = std::make_shared<Collection>(schema, options_.dense, nullptr);
        return {};
      },
      [&](std::vector<Record> batch) -> std::expected<void, core::error> {
        return collection->apply_replayed(std::move(batch));
      }};
  auto replayed = storage::replay_log(log_path, visitor);
  if (!replayed) return std::unexpected(replayed.error());

  std::optional<std::uint64_t> truncate_to;
  if (replayed->stats.torn_tail) {
    logger()->warn("[wal] '{}': dropping torn tail after {} valid bytes", dir_name,
                   replayed->stats.valid_bytes);
    truncate_to = replayed->stats.valid_bytes;
  }
  auto wal = storage::WalRecordLog::open(storage::WalRecordLogOptions{
      log_path, options_.fsync_on_write, truncate_to, replayed->stats.last_lsn + 1});
  if (!wal) return std::unexpected(wal.error());
  collection->attach_log(std::move(*wal));

  logger()->debug("[wal] '{}': replayed {} frame(s), {} record(s)", dir_name,
                  replayed->stats.frames, collection->info().points_count);
  return collection;
}

auto CollectionManager::open() -> std::expected<std::size_t, core::error> {
  if (!persistent()) return std::size_t{0};

  std::error_code ec;
  fs::create_directories(options_.storage_root, ec);
  if (ec) {
    return core::make_unexpected(core::error_code::io_failed,
                                 "cannot create storage root " + options_.storage_root.string() +
                                     ": " + ec.message(),
                                 "collection.manager");
  }

  std::unique_lock lock(registry_mutex_);
  std::size_t restored = 0;
  fs::directory_iterator it(options_.storage_root, ec);
  for (const fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
    std::error_code entry_ec;
    if (!it->is_directory(entry_ec)) continue;
    const std::string name = it->path().filename().string();
    if (!validate_name(name) || !fs::exists(it->path() / kCollectionLogFile, entry_ec)) {
      logger()->warn("[collection] skipping '{}': not a collection directory", name);
      continue;
    }
    auto collection = restore(it->path());
    if (!collection && collection.error().code == core::error_code::not_found) {
      logger()->warn("[collection] skipping '{}': {}", name, collection.error().message);
      continue;
    }
    if (!collection) {
      logger()->error("[collection] replay of '{}' failed: {}", name, collection.error().message);
      return std::unexpected(collection.error());
    }
    collections_.insert_or_assign(name, std::move(*collection));
    ++restored;
  }
  if (ec) {
    return core::make_unexpected(core::error_code::io_failed,
                                 "cannot list storage root: " + ec.message(), "collection.manager");
  }
  logger()->info("[collection] restored {} collection(s) from {}", restored, options_.storage_root.string());
  return restored;
}

auto CollectionManager::exists(std::string_view name) const -> bool {
  std::shared_lock lock(registry_mutex_);
  return collections_.find(name) != collections_.end();
}

auto CollectionManager::create(const std::string& name, std::size_t embedding_size, DistanceMetric metric,
                               bool do_reset) -> std::expected<bool, core::error> {
  if (auto ok = validate_name(name); !ok) return std::unexpected(ok.error());
  if (embedding_size == 0) {
    return core::make_unexpected(core::error_code::validation_failed,
                                 "embedding_size must be positive", "collection.manager");
  }

  std::unique_lock lock(registry_mutex_);
  if (do_reset) {
    if (auto removed = remove_locked(name); !removed) return std::unexpected(removed.error());
  } else if (collections_.contains(name)) {
    return false;
  }

  CollectionSchema schema{name, embedding_size, metric};
  std::unique_ptr<storage::RecordLog> log;
  if (persistent()) {
    const fs::path dir = collection_dir(name);
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);
    if (ec) {
      return core::make_unexpected(core::error_code::io_failed,
                                   "cannot create " + dir.string() + ": " + ec.message(),
                                   "collection.manager");
    }
    auto wal = storage::WalRecordLog::open(
        storage::WalRecordLogOptions{dir / kCollectionLogFile, options_.fsync_on_write, std::nullopt, 1});
    if (!wal) return std::unexpected(wal.error());
    if (auto ok = (*wal)->append_schema(schema); !ok) return std::unexpected(ok.error());
    log = std::move(*wal);
  }

  collections_.emplace(name, std::make_shared<Collection>(std::move(schema), options_.dense, std::move(log)));
  logger()->info("[collection] created '{}' (dim={}, metric={})", name, embedding_size, to_string(metric));
  return true;
}

auto CollectionManager::remove_locked(const std::string& name) -> std::expected<bool, core::error> {
  auto it = collections_.find(name);
  if (it == collections_.end()) return false;
  {
    auto collection_lock = it->second->lock_exclusive();
    it->second->mark_dropped();
  }
  collections_.erase(it);

  if (persistent()) {
    std::error_code ec;
    fs::remove_all(collection_dir(name), ec);
    if (ec) {
      return core::make_unexpected(core::error_code::io_failed,
                                   "cannot remove directory of '" + name + "': " + ec.message(),
                                   "collection.manager");
    }
  }
  logger()->info("[collection] deleted '{}'", name);
  return true;
}

auto CollectionManager::remove(const std::string& name) -> std::expected<bool, core::error> {
  std::unique_lock lock(registry_mutex_);
  return remove_locked(name);
}

auto CollectionManager::get(std::string_view name) const
    -> std::expected<std::shared_ptr<Collection>, core::error> {
  std::shared_lock lock(registry_mutex_);
  auto it = collections_.find(name);
  if (it == collections_.end()) {
    return core::make_unexpected(core::error_code::not_found,
                                 "collection '" + std::string(name) + "' not found",
                                 "collection.manager");
  }
  return it->second;
}

auto CollectionManager::info(std::string_view name) const -> std::expected<CollectionInfo, core::error> {
  auto collection = get(name);
  if (!collection) return std::unexpected(collection.error());
  return (*collection)->info();
}

auto CollectionManager::list() const -> std::vector<std::string> {
  std::shared_lock lock(registry_mutex_);
  std::vector<std::string> names;
  names.reserve(collections_.size());
  for (const auto& [name, _] : collections_) names.push_back(name);
  return names;
}

auto CollectionManager::flush() -> std::expected<void, core::error> {
  std::shared_lock lock(registry_mutex_);
  for (const auto& [name, collection] : collections_) {
    if (auto ok = collection->flush(); !ok) return ok;
  }
  return {};
}

} // namespace vectra
