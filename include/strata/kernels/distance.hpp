#pragma once

/** \file distance.hpp
 *  \brief Scalar cosine kernels used on the graph hot path.
 *
 * Preconditions
 * - a.size() == b.size()
 * - All inputs are finite
 * Zero-magnitude inputs are handled: similarity is 0 and distance is 1, so both
 * functions are total.
 * Determinism: pure functions, no allocations, no exceptions.
 */

#include <cmath>
#include <cstddef>
#include <span>

#if defined(__x86_64__) || defined(_M_X64) || defined(_M_AMD64)
#include <immintrin.h>
#endif

namespace strata::kernels {

namespace detail {

/** \brief Software prefetch hint for scalar loops. */
inline void scalar_prefetch(const float* ptr) noexcept {
#if defined(__x86_64__) || defined(_M_X64) || defined(_M_AMD64)
    _mm_prefetch(reinterpret_cast<const char*>(ptr + 16), _MM_HINT_T0);
#elif defined(__GNUC__)
    __builtin_prefetch(ptr + 16, 0, 3);
#else
    (void)ptr;
#endif
}

} // namespace detail

/** \brief Cosine similarity: (a·b) / (||a|| * ||b||), or 0 if either norm is 0. O(d). */
inline float cosine_similarity(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  float dot0 = 0.0f, dot1 = 0.0f, dot2 = 0.0f, dot3 = 0.0f;
  float na0 = 0.0f, na1 = 0.0f, na2 = 0.0f, na3 = 0.0f;
  float nb0 = 0.0f, nb1 = 0.0f, nb2 = 0.0f, nb3 = 0.0f;
  std::size_t i = 0;

  const std::size_t unroll_end = n & ~static_cast<std::size_t>(3);
  for (; i < unroll_end; i += 4) {
    if (i + 16 < n) {
      detail::scalar_prefetch(pa + i);
      detail::scalar_prefetch(pb + i);
    }

    const float a0 = pa[i], b0 = pb[i];
    const float a1 = pa[i+1], b1 = pb[i+1];
    const float a2 = pa[i+2], b2 = pb[i+2];
    const float a3 = pa[i+3], b3 = pb[i+3];

    dot0 += a0 * b0; na0 += a0 * a0; nb0 += b0 * b0;
    dot1 += a1 * b1; na1 += a1 * a1; nb1 += b1 * b1;
    dot2 += a2 * b2; na2 += a2 * a2; nb2 += b2 * b2;
    dot3 += a3 * b3; na3 += a3 * a3; nb3 += b3 * b3;
  }

  float dot = dot0 + dot1 + dot2 + dot3;
  float na_total = na0 + na1 + na2 + na3;
  float nb_total = nb0 + nb1 + nb2 + nb3;

  for (; i < n; ++i) {
    const float av = pa[i], bv = pb[i];
    dot += av * bv;
    na_total += av * av;
    nb_total += bv * bv;
  }

  if (na_total == 0.0f || nb_total == 0.0f) {
    return 0.0f;
  }
  return dot / (std::sqrt(na_total) * std::sqrt(nb_total));
}

/** \brief Cosine distance: 1 - cosine_similarity(a,b); 1.0 when either vector is zero. O(d). */
inline float cosine_distance(std::span<const float> a, std::span<const float> b) noexcept {
  return 1.0f - cosine_similarity(a, b);
}

} // namespace strata::kernels
