#pragma once

/** \file metric.hpp
 *  \brief Checked entry points around the cosine kernels.
 *
 * The kernels in distance.hpp trust their callers; these wrappers validate
 * lengths first and report mismatches as core::error_code::dimension_mismatch.
 */

#include <cstddef>
#include <expected>
#include <span>

#include "strata/error.hpp"

namespace strata::kernels {

/** \brief Cosine distance with a length check.
 *
 * \return 1 - cos(a, b), or 1.0 when either vector has zero magnitude
 * \return dimension_mismatch when a.size() != b.size()
 */
auto cosine_distance_checked(std::span<const float> a, std::span<const float> b)
    -> std::expected<float, core::error>;

/** \brief Verifies that a vector has the expected length.
 *
 * \param what Used in the error message, e.g. "vector" or "query"
 * \param component Reported as core::error::component
 */
auto check_dimension(std::span<const float> v, std::size_t expected_dim,
                     const char* what, const char* component)
    -> std::expected<void, core::error>;

} // namespace strata::kernels
