#pragma once

/** \file neighbor_selector.hpp
 *  \brief Bounded-degree neighbor selection for HNSW insertion and pruning.
 *
 * Both strategies are deterministic: candidates are ordered by
 * (distance, slot) before selection, so identical inputs give identical
 * membership and order.
 */

#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace strata::index {

/** \brief (distance to the base node, arena slot). */
using Candidate = std::pair<float, std::uint32_t>;

/** \brief Strategy used when wiring a new node and when pruning an overflowing one. */
enum class NeighborSelection : std::uint8_t {
    closest,    /**< keep the max_neighbors nearest candidates */
    diverse,    /**< HNSW paper heuristic, back-filled with nearest discards */
};

/** \brief Sort ascending and truncate to max_neighbors. */
auto select_closest(std::vector<Candidate> candidates, std::uint32_t max_neighbors)
    -> std::vector<Candidate>;

/** \brief Diversity-aware selection (Algorithm 4 of the HNSW paper).
 *
 * Walking candidates nearest first, a candidate is kept only if it is closer
 * to the base node than to every candidate already kept. Rejected candidates
 * refill the remaining slots in nearest-first order, so the result size is
 * min(max_neighbors, candidates.size()) as with select_closest.
 *
 * \param pair_distance distance between two candidate slots
 */
auto select_diverse(std::vector<Candidate> candidates, std::uint32_t max_neighbors,
                    const std::function<float(std::uint32_t, std::uint32_t)>& pair_distance)
    -> std::vector<Candidate>;

} // namespace strata::index
