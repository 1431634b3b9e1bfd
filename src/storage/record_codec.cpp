#include "vectra/storage/record_codec.hpp"

#include <algorithm>
#include <bit>
#include <cstring>
#include <string>
#include <type_traits>
#include <variant>

namespace vectra::storage {

namespace {

/** Unsigned integer with the width of floating type T. */
template <typename T>
using bits_of = std::conditional_t<sizeof(T) == 4, std::uint32_t, std::uint64_t>;

/** Little-endian writer; floats travel as their IEEE-754 bit patterns. */
class ByteWriter {
public:
  template <typename T>
  auto put(T v) -> void {
    if constexpr (std::is_floating_point_v<T>) {
      put(std::bit_cast<bits_of<T>>(v));
    } else {
      if constexpr (std::endian::native == std::endian::big && sizeof(T) > 1) v = std::byteswap(v);
      const auto* p = reinterpret_cast<const std::uint8_t*>(&v);
      out_.insert(out_.end(), p, p + sizeof(T));
    }
  }
  template <typename T>
  auto put_array(const T* data, std::size_t n) -> void {
    for (std::size_t i = 0; i < n; ++i) put(data[i]);
  }
  auto put_bytes(const void* data, std::size_t n) -> void {
    const auto* p = static_cast<const std::uint8_t*>(data);
    out_.insert(out_.end(), p, p + n);
  }
  auto put_string(const std::string& s) -> void {
    put(static_cast<std::uint32_t>(s.size()));
    put_bytes(s.data(), s.size());
  }
  auto take() -> std::vector<std::uint8_t> { return std::move(out_); }

private:
  std::vector<std::uint8_t> out_;
};

class ByteReader {
public:
  explicit ByteReader(std::span<const std::uint8_t> in) : in_(in) {}

  template <typename T>
  auto get(T& v) -> bool {
    if constexpr (std::is_floating_point_v<T>) {
      bits_of<T> raw{};
      if (!get(raw)) return false;
      v = std::bit_cast<T>(raw);
      return true;
    } else {
      if (in_.size() - pos_ < sizeof(T)) return false;
      std::memcpy(&v, in_.data() + pos_, sizeof(T));
      if constexpr (std::endian::native == std::endian::big && sizeof(T) > 1) v = std::byteswap(v);
      pos_ += sizeof(T);
      return true;
    }
  }
  template <typename T>
  auto get_array(T* out, std::size_t n) -> bool {
    if ((in_.size() - pos_) / sizeof(T) < n) return false;
    for (std::size_t i = 0; i < n; ++i) {
      if (!get(out[i])) return false;
    }
    return true;
  }
  auto get_string(std::string& s) -> bool {
    std::uint32_t n = 0;
    if (!get(n) || in_.size() - pos_ < n) return false;
    s.assign(reinterpret_cast<const char*>(in_.data() + pos_), n);
    pos_ += n;
    return true;
  }
  auto remaining() const noexcept -> std::size_t { return in_.size() - pos_; }

private:
  std::span<const std::uint8_t> in_;
  std::size_t pos_{0};
};

auto corrupt(const char* what) -> std::unexpected<core::error> {
  return core::make_unexpected(core::error_code::data_integrity, what, "storage.codec");
}

auto put_metadata(ByteWriter& w, const Metadata& md) -> void {
  std::vector<const Metadata::value_type*> entries;
  entries.reserve(md.size());
  for (const auto& kv : md) entries.push_back(&kv);
  std::sort(entries.begin(), entries.end(),
            [](const auto* a, const auto* b) { return a->first < b->first; });

  w.put(static_cast<std::uint32_t>(entries.size()));
  for (const auto* kv : entries) {
    w.put_string(kv->first);
    w.put(static_cast<std::uint8_t>(kv->second.index()));
    std::visit([&w](const auto& v) {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, std::string>) w.put_string(v);
      else if constexpr (std::is_same_v<T, bool>) w.put(static_cast<std::uint8_t>(v ? 1 : 0));
      else w.put(v);
    }, kv->second);
  }
}

auto get_metadata(ByteReader& r, Metadata& md) -> bool {
  std::uint32_t n = 0;
  if (!r.get(n)) return false;
  md.reserve(n);
  for (std::uint32_t i = 0; i < n; ++i) {
    std::string key;
    std::uint8_t tag = 0;
    if (!r.get_string(key) || !r.get(tag)) return false;
    switch (tag) {
      case 0: { std::string s; if (!r.get_string(s)) return false; md.emplace(std::move(key), std::move(s)); break; }
      case 1: { double d = 0; if (!r.get(d)) return false; md.emplace(std::move(key), d); break; }
      case 2: { std::int64_t v = 0; if (!r.get(v)) return false; md.emplace(std::move(key), v); break; }
      case 3: { std::uint8_t b = 0; if (!r.get(b)) return false; md.emplace(std::move(key), b != 0); break; }
      default: return false;
    }
  }
  return true;
}

} // namespace

auto encode_schema(const CollectionSchema& schema) -> std::vector<std::uint8_t> {
  ByteWriter w;
  w.put(CODEC_VERSION);
  w.put(static_cast<std::uint64_t>(schema.dimension));
  w.put(static_cast<std::uint8_t>(schema.metric));
  w.put_string(schema.name);
  return w.take();
}

auto decode_schema(std::span<const std::uint8_t> bytes) -> std::expected<CollectionSchema, core::error> {
  ByteReader r(bytes);
  std::uint16_t version = 0;
  std::uint64_t dim = 0;
  std::uint8_t metric = 0;
  CollectionSchema schema;
  if (!r.get(version) || version != CODEC_VERSION) return corrupt("unsupported schema version");
  if (!r.get(dim) || !r.get(metric) || !r.get_string(schema.name)) return corrupt("truncated schema");
  if (metric > static_cast<std::uint8_t>(DistanceMetric::Dot)) return corrupt("unknown metric tag");
  schema.dimension = static_cast<std::size_t>(dim);
  schema.metric = static_cast<DistanceMetric>(metric);
  return schema;
}

auto encode_batch(std::span<const Record> records) -> std::vector<std::uint8_t> {
  ByteWriter w;
  w.put(CODEC_VERSION);
  w.put(static_cast<std::uint32_t>(records.size()));
  for (const auto& rec : records) {
    w.put(rec.id);
    w.put_string(rec.text);
    w.put(static_cast<std::uint8_t>(rec.metadata ? 1 : 0));
    if (rec.metadata) put_metadata(w, *rec.metadata);
    w.put(static_cast<std::uint32_t>(rec.dense.size()));
    w.put_array(rec.dense.data(), rec.dense.size());
    w.put(static_cast<std::uint8_t>(rec.sparse ? 1 : 0));
    if (rec.sparse) {
      w.put(static_cast<std::uint32_t>(rec.sparse->nnz()));
      w.put_array(rec.sparse->indices.data(), rec.sparse->nnz());
      w.put_array(rec.sparse->values.data(), rec.sparse->nnz());
    }
  }
  return w.take();
}

auto decode_batch(std::span<const std::uint8_t> bytes) -> std::expected<std::vector<Record>, core::error> {
  ByteReader r(bytes);
  std::uint16_t version = 0;
  std::uint32_t count = 0;
  if (!r.get(version) || version != CODEC_VERSION) return corrupt("unsupported batch version");
  if (!r.get(count)) return corrupt("truncated batch header");

  std::vector<Record> out;
  out.reserve(std::min<std::size_t>(count, r.remaining()));
  for (std::uint32_t i = 0; i < count; ++i) {
    Record rec;
    std::uint8_t has_md = 0, has_sparse = 0;
    std::uint32_t dim = 0;
    if (!r.get(rec.id) || !r.get_string(rec.text) || !r.get(has_md)) return corrupt("truncated record");
    if (has_md) {
      Metadata md;
      if (!get_metadata(r, md)) return corrupt("truncated metadata");
      rec.metadata = std::move(md);
    }
    if (!r.get(dim) || r.remaining() / sizeof(float) < dim) return corrupt("truncated dense vector");
    rec.dense.resize(dim);
    if (!r.get_array(rec.dense.data(), dim)) return corrupt("truncated dense vector");
    if (!r.get(has_sparse)) return corrupt("truncated record");
    if (has_sparse) {
      std::uint32_t nnz = 0;
      if (!r.get(nnz) || r.remaining() / (sizeof(std::uint32_t) + sizeof(float)) < nnz) {
        return corrupt("truncated sparse vector");
      }
      SparseVector sv;
      sv.indices.resize(nnz);
      sv.values.resize(nnz);
      if (!r.get_array(sv.indices.data(), nnz) ||
          !r.get_array(sv.values.data(), nnz)) {
        return corrupt("truncated sparse vector");
      }
      rec.sparse = std::move(sv);
    }
    out.push_back(std::move(rec));
  }
  if (r.remaining() != 0) return corrupt("trailing bytes in batch");
  return out;
}

} // namespace vectra::storage
