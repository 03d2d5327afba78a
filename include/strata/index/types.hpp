#pragma once

/** \file types.hpp
 *  \brief Result types shared by the graph and exact indexes.
 */

#include <string>

namespace strata::index {

/** \brief Default minimum similarity for search(). */
inline constexpr float kDefaultThreshold = 0.5f;

/** \brief One ranked result. similarity == 1 - distance. */
struct SearchMatch {
    std::string id;
    float distance{0.0f};
    float similarity{0.0f};
};

} // namespace strata::index
