#include "vectra/filter/filter_eval.hpp"

#include <string>

namespace vectra::filter_eval {

namespace {

auto term_matches(const MetadataValue& value, const std::string& expected) -> bool {
  if (const auto* s = std::get_if<std::string>(&value)) return *s == expected;
  if (const auto* b = std::get_if<bool>(&value)) return expected == (*b ? "true" : "false");
  if (const auto* i = std::get_if<std::int64_t>(&value)) return std::to_string(*i) == expected;
  return false;
}

auto as_number(const MetadataValue& value, double& out) -> bool {
  if (const auto* d = std::get_if<double>(&value)) { out = *d; return true; }
  if (const auto* i = std::get_if<std::int64_t>(&value)) { out = static_cast<double>(*i); return true; }
  return false;
}

auto matches_node(const filter_expr& e, const Metadata* md) -> bool {
  if (std::holds_alternative<term>(e.node)) {
    const auto& t = std::get<term>(e.node);
    if (!md) return false;
    auto it = md->find(t.field);
    return it != md->end() && term_matches(it->second, t.value);
  } else if (std::holds_alternative<range>(e.node)) {
    const auto& r = std::get<range>(e.node);
    if (!md) return false;
    auto it = md->find(r.field);
    double v = 0.0;
    if (it == md->end() || !as_number(it->second, v)) return false;
    return v >= r.min_value && v <= r.max_value;
  } else if (std::holds_alternative<filter_expr::and_t>(e.node)) {
    for (const auto& c : std::get<filter_expr::and_t>(e.node).children) {
      if (!matches_node(c, md)) return false;
    }
    return true;
  } else if (std::holds_alternative<filter_expr::or_t>(e.node)) {
    for (const auto& c : std::get<filter_expr::or_t>(e.node).children) {
      if (matches_node(c, md)) return true;
    }
    return false;
  } else if (std::holds_alternative<filter_expr::not_t>(e.node)) {
    for (const auto& c : std::get<filter_expr::not_t>(e.node).children) {
      if (matches_node(c, md)) return false;
    }
    return true;
  }
  return false;
}

} // namespace

auto matches(const filter_expr& expr, const Metadata* metadata) -> bool {
  return matches_node(expr, metadata);
}

} // namespace vectra::filter_eval
