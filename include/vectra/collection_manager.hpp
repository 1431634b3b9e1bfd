#pragma once

/** \file collection_manager.hpp
 *  \brief Registry of named collections and their on-disk directories.
 *
 * Layout: <storage_root>/<collection>/collection.wal. An empty storage_root
 * keeps every collection in memory.
 *
 * Concurrency: the registry has its own std::shared_mutex. create/remove take
 * it exclusive; remove also takes the collection's exclusive lock so it waits
 * for in-flight operations. Collections are handed out as shared_ptr.
 */

#include <cstddef>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "vectra/collection.hpp"
#include "vectra/error.hpp"
#include "vectra/index/dense_index.hpp"
#include "vectra/types.hpp"

namespace vectra {

inline constexpr const char* kCollectionLogFile = "collection.wal";

struct ManagerOptions {
  std::filesystem::path storage_root;      /**< empty = in-memory only */
  index::DenseIndexParams dense;
  bool fsync_on_write{false};
};

class CollectionManager {
public:
  explicit CollectionManager(ManagerOptions options);

  /** \brief Rebuild every collection found under storage_root by replaying its log.
   *  \return number of collections restored
   */
  auto open() -> std::expected<std::size_t, core::error>;

  auto exists(std::string_view name) const -> bool;

  /** \brief Create a collection.
   *
   * With do_reset an existing collection is deleted first. Returns false,
   * without mutation, when the collection exists and do_reset is false.
   * embedding_size == 0 or an invalid name is validation_failed.
   */
  auto create(const std::string& name, std::size_t embedding_size, DistanceMetric metric,
              bool do_reset = false) -> std::expected<bool, core::error>;

  /** \brief Delete a collection with its records, indexes and directory. False if absent. */
  auto remove(const std::string& name) -> std::expected<bool, core::error>;

  auto info(std::string_view name) const -> std::expected<CollectionInfo, core::error>;

  /** \brief Sorted collection names. */
  auto list() const -> std::vector<std::string>;

  /** \brief Resolve a collection; not_found if absent. */
  auto get(std::string_view name) const -> std::expected<std::shared_ptr<Collection>, core::error>;

  /** \brief Flush every collection log to stable storage. */
  auto flush() -> std::expected<void, core::error>;

  auto options() const noexcept -> const ManagerOptions& { return options_; }

  /** \brief 1-255 characters from [A-Za-z0-9_.-], not "." or "..". */
  static auto validate_name(std::string_view name) -> std::expected<void, core::error>;

private:
  auto persistent() const noexcept -> bool { return !options_.storage_root.empty(); }
  auto collection_dir(const std::string& name) const -> std::filesystem::path;
  auto remove_locked(const std::string& name) -> std::expected<bool, core::error>;
  auto restore(const std::filesystem::path& dir) -> std::expected<std::shared_ptr<Collection>, core::error>;

  ManagerOptions options_;
  mutable std::shared_mutex registry_mutex_;
  std::map<std::string, std::shared_ptr<Collection>, std::less<>> collections_;
};

} // namespace vectra
