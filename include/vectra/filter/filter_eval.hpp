#pragma once

/** \file filter_eval.hpp
 *  \brief Evaluate filter expressions against a record's metadata.
 *
 * Semantics: and([]) == true, or([]) == false, not(children) is true when no
 * child matches. A record without metadata matches no term or range.
 */

#include "vectra/filter/filter_expr.hpp"
#include "vectra/types.hpp"

namespace vectra::filter_eval {

auto matches(const filter_expr& expr, const Metadata* metadata) -> bool;

inline auto matches(const filter_expr& expr, const std::optional<Metadata>& metadata) -> bool {
  return matches(expr, metadata ? &*metadata : nullptr);
}

} // namespace vectra::filter_eval
