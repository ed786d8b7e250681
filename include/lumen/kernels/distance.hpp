#pragma once

/** \file distance.hpp
 *  \brief Scalar similarity kernels over embedding vectors.
 *
 * Preconditions
 * - a.size() == b.size() > 0
 * - All inputs are finite
 * Determinism: pure functions, no allocations, no exceptions on hot paths.
 * Stored vectors are unit length, so inner_product is the cosine similarity.
 */

#include <cmath>
#include <cstddef>
#include <span>

#if defined(__x86_64__) || defined(_M_X64) || defined(_M_AMD64)
#include <immintrin.h>
#endif

namespace lumen::kernels {

namespace detail {

/** \brief Software prefetch hint for scalar loops. */
inline void scalar_prefetch(const float* ptr) noexcept {
#if defined(__x86_64__) || defined(_M_X64) || defined(_M_AMD64)
    _mm_prefetch(reinterpret_cast<const char*>(ptr + 16), _MM_HINT_T0);
#else
    (void)ptr;
#endif
}

} // namespace detail

/** \brief Inner product: sum(a[i] * b[i]). O(d). */
inline float inner_product(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;

  const std::size_t unroll_end = n & ~static_cast<std::size_t>(3);
  for (; i < unroll_end; i += 4) {
    if (i + 16 < n) {
      detail::scalar_prefetch(pa + i);
      detail::scalar_prefetch(pb + i);
    }
    s0 += pa[i] * pb[i];
    s1 += pa[i+1] * pb[i+1];
    s2 += pa[i+2] * pb[i+2];
    s3 += pa[i+3] * pb[i+3];
  }

  float s = s0 + s1 + s2 + s3;
  for (; i < n; ++i) {
    s += pa[i] * pb[i];
  }
  return s;
}

/** \brief Euclidean norm, accumulated in double. O(d). */
inline double l2_norm(std::span<const float> a) noexcept {
  double s = 0.0;
  for (float v : a) s += static_cast<double>(v) * static_cast<double>(v);
  return std::sqrt(s);
}

/** \brief Unit-vector similarity; identical to cosine for normalized inputs. */
inline float similarity(std::span<const float> a, std::span<const float> b) noexcept {
  return inner_product(a, b);
}

/**
 * \brief Scale v to unit length in place.
 * \return false (v untouched) if v is empty, has a non-finite value, or has zero norm.
 */
inline bool normalize(std::span<float> v) noexcept {
  if (v.empty()) return false;
  for (float x : v) {
    if (!std::isfinite(x)) return false;
  }
  const double n = l2_norm(v);
  if (!(n > 0.0) || !std::isfinite(n)) return false;
  const double inv = 1.0 / n;
  for (float& x : v) x = static_cast<float>(static_cast<double>(x) * inv);
  return true;
}

} // namespace lumen::kernels
