#pragma once

/** \file distance.hpp
 *  \brief Scalar similarity kernels used by the dense index.
 *
 * Preconditions
 * - a.size() == b.size()
 * - All inputs are finite
 * Determinism: pure functions, no allocations, no exceptions.
 */

#include <cmath>
#include <cstddef>
#include <span>

namespace vectra::kernels {

/** \brief Inner product: sum(a[i] * b[i]). O(d). */
inline float inner_product(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  // 4-way unrolled
  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;
  const std::size_t unroll_end = n & ~std::size_t{3};
  for (; i < unroll_end; i += 4) {
    s0 += pa[i] * pb[i];
    s1 += pa[i + 1] * pb[i + 1];
    s2 += pa[i + 2] * pb[i + 2];
    s3 += pa[i + 3] * pb[i + 3];
  }
  float s = (s0 + s1) + (s2 + s3);
  for (; i < n; ++i) s += pa[i] * pb[i];
  return s;
}

/** \brief Squared Euclidean norm. */
inline float squared_norm(std::span<const float> a) noexcept {
  return inner_product(a, a);
}

/** \brief Cosine similarity; 0 when either norm is zero. */
inline float cosine_similarity(std::span<const float> a, std::span<const float> b) noexcept {
  const float na = squared_norm(a);
  const float nb = squared_norm(b);
  if (na <= 0.0f || nb <= 0.0f) return 0.0f;
  return inner_product(a, b) / (std::sqrt(na) * std::sqrt(nb));
}

/** \brief Scale v to unit length in place. Zero vectors are left unchanged.
 *  \return the original norm
 */
inline float normalize_in_place(std::span<float> v) noexcept {
  const float n2 = squared_norm(v);
  if (n2 <= 0.0f) return 0.0f;
  const float norm = std::sqrt(n2);
  const float inv = 1.0f / norm;
  for (float& x : v) x *= inv;
  return norm;
}

} // namespace vectra::kernels
