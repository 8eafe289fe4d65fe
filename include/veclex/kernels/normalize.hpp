#pragma once

/** \file normalize.hpp
 *  \brief Scalar L2 norm and in-place normalization of dense vectors.
 *
 * Zero vectors are left unchanged. Accumulation is in double so that long
 * embeddings normalize to unit length within float precision.
 */

#include <cmath>
#include <cstddef>
#include <span>
#include <vector>

namespace veclex::kernels {

/** \brief Euclidean length: sqrt(sum(a[i]^2)). O(d). */
inline double l2_norm(std::span<const float> a) noexcept {
  double s = 0.0;
  for (const float x : a) s += static_cast<double>(x) * static_cast<double>(x);
  return std::sqrt(s);
}

/** \brief Scale to unit length in place; no-op for a zero vector. */
inline void l2_normalize(std::span<float> a) noexcept {
  const double n = l2_norm(a);
  if (n <= 0.0) return;
  const double inv = 1.0 / n;
  for (float& x : a) x = static_cast<float>(static_cast<double>(x) * inv);
}

/** \brief Normalize every row of a batch in place. */
inline void l2_normalize_rows(std::vector<std::vector<float>>& rows) noexcept {
  for (auto& row : rows) l2_normalize(row);
}

} // namespace veclex::kernels
