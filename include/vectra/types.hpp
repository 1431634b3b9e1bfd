#pragma once

/** \file types.hpp
 *  \brief Value types shared by the record store, indexes and query engine.
 *
 * Ownership: all types are value-semantic. Callers own input buffers passed as
 * std::span; the library copies what it keeps.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "vectra/error.hpp"

namespace vectra {

/** \brief Record identifier (caller supplied or store assigned). */
using RecordId = std::uint64_t;

/** \brief Similarity used by a collection's dense index. */
enum class DistanceMetric : std::uint8_t {
  Cosine = 0,   /**< cosine similarity; vectors are stored unit-normalised */
  Dot = 1       /**< raw inner product */
};

auto to_string(DistanceMetric metric) noexcept -> std::string_view;

/** \brief Parse "cosine" | "dot" (also accepts "ip"). */
auto parse_metric(std::string_view name) -> std::expected<DistanceMetric, core::error>;

/** \brief Metadata value type. */
using MetadataValue = std::variant<std::string, double, std::int64_t, bool>;

/** \brief Opaque per-record key/value payload. */
using Metadata = std::unordered_map<std::string, MetadataValue>;

/** \brief Sparse vector as parallel (dimension id, weight) arrays. */
struct SparseVector {
  std::vector<std::uint32_t> indices;  /**< dimension ids, unique */
  std::vector<float> values;           /**< weights, same length as indices */

  auto nnz() const noexcept -> std::size_t { return indices.size(); }
  auto empty() const noexcept -> bool { return indices.empty(); }

  /** \brief Check lengths, uniqueness of indices and finiteness of values. */
  auto validate() const -> std::expected<void, core::error>;

  /** \brief Copy with zero weights removed and indices sorted ascending. */
  auto compacted() const -> SparseVector;

  /** \brief Merge-based dot product; both vectors must be compacted. */
  auto dot(const SparseVector& other) const noexcept -> float;

  friend auto operator==(const SparseVector&, const SparseVector&) -> bool = default;
};

/** \brief A record as submitted for ingestion. */
struct RecordInput {
  std::optional<RecordId> id;          /**< assigned by the store when empty */
  std::string text;
  std::optional<Metadata> metadata;
  std::vector<float> dense;
  std::optional<SparseVector> sparse;
};

/** \brief A record as owned by the record store. */
struct Record {
  RecordId id{0};
  std::string text;
  std::optional<Metadata> metadata;
  std::vector<float> dense;            /**< as submitted, before any normalisation */
  std::optional<SparseVector> sparse;  /**< compacted form */
};

/** \brief Ranked index hit. */
struct ScoredId {
  RecordId id{0};
  float score{0.0f};
};

/** \brief One search result handed back to callers. */
struct RetrievedDocument {
  float score{0.0f};
  std::string text;
  RecordId id{0};
};

/** \brief Immutable per-collection schema. */
struct CollectionSchema {
  std::string name;
  std::size_t dimension{0};
  DistanceMetric metric{DistanceMetric::Cosine};
};

/** \brief Collection description returned by info(). */
struct CollectionInfo {
  std::string name;
  std::size_t dimension{0};
  DistanceMetric metric{DistanceMetric::Cosine};
  std::size_t points_count{0};         /**< live records */
  std::size_t sparse_points_count{0};  /**< live records carrying a sparse vector */
  std::size_t sparse_dimensions{0};    /**< distinct dimension ids with postings */
  RecordId next_id{0};                 /**< id the store would assign next */
};

} // namespace vectra
