#pragma once

/** \file filter_expr.hpp
 *  \brief Payload filter AST evaluated against record metadata.
 *
 * Use cases: restrict dense, sparse and hybrid searches to records whose
 * metadata satisfies a predicate. Compiled to a Roaring64Map of record ids.
 * Ownership: the AST is value-semantic and self-contained.
 */

#include <string>
#include <variant>
#include <vector>

namespace vectra {

/** \brief Equality predicate field == value.
 *
 * Matches a string value exactly, a bool against "true"/"false" and an
 * int64 against its decimal form. Doubles never match a term.
 */
struct term {
  std::string field;
  std::string value;
};

/** \brief Numeric range predicate min_value <= field <= max_value. */
struct range {
  std::string field;
  double min_value{}; /**< inclusive */
  double max_value{}; /**< inclusive */
};

/** \brief Recursive filter expression. */
struct filter_expr {
  struct and_t { std::vector<filter_expr> children; };
  struct or_t  { std::vector<filter_expr> children; };
  struct not_t { std::vector<filter_expr> children; };

  std::variant<term, range, and_t, or_t, not_t> node;
};

/** \name Builders */
///@{
inline auto match(std::string field, std::string value) -> filter_expr {
  return filter_expr{term{std::move(field), std::move(value)}};
}
inline auto between(std::string field, double lo, double hi) -> filter_expr {
  return filter_expr{range{std::move(field), lo, hi}};
}
inline auto all_of(std::vector<filter_expr> children) -> filter_expr {
  return filter_expr{filter_expr::and_t{std::move(children)}};
}
inline auto any_of(std::vector<filter_expr> children) -> filter_expr {
  return filter_expr{filter_expr::or_t{std::move(children)}};
}
inline auto none_of(std::vector<filter_expr> children) -> filter_expr {
  return filter_expr{filter_expr::not_t{std::move(children)}};
}
///@}

} // namespace vectra
