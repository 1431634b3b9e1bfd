#include "vectra/config.hpp"
#include "vectra/core/platform_utils.hpp"

#include <cmath>
#include <limits>

namespace vectra {

namespace {

auto tag(core::error err, const char* var) -> std::unexpected<core::error> {
  err.message = std::string(var) + ": " + err.message;
  return std::unexpected(std::move(err));
}

template <typename T>
auto read_uint(const char* var, T& out) -> std::expected<void, core::error> {
  auto raw = core::safe_getenv(var);
  if (!raw) return {};
  auto v = core::parse_uint(*raw);
  if (!v) return tag(v.error(), var);
  if (*v > std::numeric_limits<T>::max()) {
    return tag(core::error{core::error_code::config_invalid, "value out of range", "core.env"}, var);
  }
  out = static_cast<T>(*v);
  return {};
}

auto read_bool(const char* var, bool& out) -> std::expected<void, core::error> {
  auto raw = core::safe_getenv(var);
  if (!raw) return {};
  auto v = core::parse_bool(*raw);
  if (!v) return tag(v.error(), var);
  out = *v;
  return {};
}

} // namespace

auto options_from_env(EngineOptions base) -> std::expected<EngineOptions, core::error> {
  EngineOptions o = std::move(base);

  if (auto root = core::safe_getenv("VECTRA_STORAGE_ROOT")) o.storage_root = *root;
  if (auto metric = core::safe_getenv("VECTRA_DISTANCE_METRIC")) {
    auto m = parse_metric(*metric);
    if (!m) return tag(m.error(), "VECTRA_DISTANCE_METRIC");
    o.distance_metric = *m;
  }
  if (auto k = core::safe_getenv("VECTRA_RRF_K")) {
    auto v = core::parse_float(*k);
    if (!v) return tag(v.error(), "VECTRA_RRF_K");
    o.rrf_k = *v;
  }
  if (auto level = core::safe_getenv("VECTRA_LOG_LEVEL")) o.log_level = *level;

  if (auto r = read_uint("VECTRA_BATCH_SIZE", o.batch_size); !r) return std::unexpected(r.error());
  if (auto r = read_uint("VECTRA_HNSW_M", o.dense.M); !r) return std::unexpected(r.error());
  if (auto r = read_uint("VECTRA_HNSW_EF_CONSTRUCTION", o.dense.ef_construction); !r) return std::unexpected(r.error());
  if (auto r = read_uint("VECTRA_HNSW_EF_SEARCH", o.dense.ef_search); !r) return std::unexpected(r.error());
  if (auto r = read_uint("VECTRA_EXACT_SEARCH_THRESHOLD", o.dense.exact_search_threshold); !r) return std::unexpected(r.error());
  if (auto r = read_bool("VECTRA_PARALLEL_PREFETCH", o.parallel_prefetch); !r) return std::unexpected(r.error());
  if (auto r = read_bool("VECTRA_WAL_FSYNC", o.fsync_on_write); !r) return std::unexpected(r.error());

  if (auto ok = validate_options(o); !ok) return std::unexpected(ok.error());
  return o;
}

auto validate_options(const EngineOptions& options) -> std::expected<void, core::error> {
  using core::error_code;
  if (options.batch_size == 0) {
    return core::make_unexpected(error_code::config_invalid, "batch_size must be positive", "config");
  }
  if (!(options.rrf_k > 0.0f) || !std::isfinite(options.rrf_k)) {
    return core::make_unexpected(error_code::config_invalid, "rrf_k must be positive", "config");
  }
  if (options.dense.M < 2) {
    return core::make_unexpected(error_code::config_invalid, "HNSW M must be >= 2", "config");
  }
  if (options.dense.ef_construction < options.dense.M) {
    return core::make_unexpected(error_code::config_invalid, "HNSW ef_construction must be >= M", "config");
  }
  if (options.dense.ef_search == 0) {
    return core::make_unexpected(error_code::config_invalid, "HNSW ef_search must be positive", "config");
  }
  return {};
}

} // namespace vectra
