#pragma once

/** \file hnsw.hpp
 *  \brief Hierarchical Navigable Small World (HNSW) index over cosine distance.
 *
 * In-process, ephemeral ANN index keyed by string ids.
 * Features:
 * - Multi-layer proximity graph with exponentially thinning upper layers
 * - Greedy descent through upper layers, beam search (ef) at the base layer
 * - Incremental insert, in-place vector update, and hard removal
 * - Degree bounded by M on every layer through overflow pruning
 *
 * Storage: nodes live in a dense slot arena with tombstoning and slot reuse;
 * adjacency lists hold slot indices resolved through the arena.
 *
 * Thread-safety: not internally synchronized. Concurrent const calls
 * (search, diagnostics) are safe with no writer present; add/remove/clear/init
 * need exclusive access.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "strata/error.hpp"
#include "strata/index/neighbor_selector.hpp"
#include "strata/index/types.hpp"

namespace strata::index {

/** \brief HNSW build parameters. */
struct HnswBuildParams {
    std::uint32_t M{16};                    /**< Max connections per node per layer */
    std::uint32_t ef_construction{200};     /**< Beam width during insertion */
    std::uint32_t ef_search{100};           /**< Default beam width during search */
    std::uint32_t seed{42};                 /**< Random seed for level assignment */
    double level_mult{0.0};                 /**< mL; 0 selects 1 / ln(M) */
    NeighborSelection selection{NeighborSelection::closest}; /**< Pruning strategy */
};

/** \brief HNSW search parameters. */
struct HnswSearchParams {
    std::size_t k{10};                      /**< Number of matches to return */
    float threshold{kDefaultThreshold};     /**< Minimum similarity kept */
    std::uint32_t ef_search{0};             /**< Beam width; 0 uses the index default */
};

/** \brief HNSW index statistics. */
struct HnswStats {
    std::size_t n_nodes{0};                 /**< Live nodes in graph */
    std::size_t n_edges{0};                 /**< Undirected base-layer edges */
    std::size_t n_levels{0};                /**< Number of hierarchy levels */
    std::size_t n_free_slots{0};            /**< Tombstoned arena slots awaiting reuse */
    std::size_t memory_bytes{0};            /**< Estimated memory usage */
    float avg_degree{0.0f};                 /**< Average base-layer out-degree */
    std::vector<std::size_t> level_counts;  /**< Nodes whose top level is i */
};

/** \brief Hierarchical Navigable Small World index. */
class HnswIndex {
public:
    HnswIndex();
    ~HnswIndex();
    HnswIndex(HnswIndex&&) noexcept;
    HnswIndex& operator=(HnswIndex&&) noexcept;
    HnswIndex(const HnswIndex&) = delete;
    HnswIndex& operator=(const HnswIndex&) = delete;

    /** \brief Initialize (or re-initialize) the index.
     *
     * \param dim Vector dimensionality, fixed until the next init
     * \param params Build parameters; STRATA_HNSW_EF_SEARCH and
     *        STRATA_HNSW_SEED override ef_search and seed when set
     * \return Success or config_invalid
     *
     * Preconditions: dim > 0; M >= 2; ef_construction >= M; ef_search > 0;
     * level_mult >= 0.
     * Re-initializing drops every node.
     */
    auto init(std::size_t dim, const HnswBuildParams& params = {})
        -> std::expected<void, core::error>;

    /** \brief Insert a vector, or overwrite the vector of an existing id.
     *
     * An existing id keeps its level and edges; only the stored vector changes.
     *
     * \return not_initialized, invalid_argument (empty id) or
     *         dimension_mismatch; nothing is mutated on error
     * Complexity: O(M * log(N) * ef_construction)
     */
    auto add(std::string_view id, std::span<const float> vector)
        -> std::expected<void, core::error>;

    /** \brief Remove a node and every edge that points at it.
     *
     * Absent ids are a no-op. No compensating edges are added.
     * Complexity: O(N * M) over the layers the node occupied.
     */
    auto remove(std::string_view id) -> std::expected<void, core::error>;

    /** \brief Approximate k nearest neighbors by cosine similarity.
     *
     * \return at most k matches with similarity >= threshold, by descending
     *         similarity; empty when the index is empty
     */
    auto search(std::span<const float> query, std::size_t k,
                float threshold = kDefaultThreshold) const
        -> std::expected<std::vector<SearchMatch>, core::error>;

    auto search(std::span<const float> query, const HnswSearchParams& params) const
        -> std::expected<std::vector<SearchMatch>, core::error>;

    /** \brief Drop every node; dimension and parameters are kept. */
    auto clear() noexcept -> void;

    /** \brief Number of live nodes. */
    auto size() const noexcept -> std::size_t;

    auto is_initialized() const noexcept -> bool;
    auto dimension() const noexcept -> std::size_t;
    auto get_build_params() const noexcept -> HnswBuildParams;

    auto contains(std::string_view id) const noexcept -> bool;

    /** \brief Copy of the stored vector, or not_found. */
    auto get_vector(std::string_view id) const
        -> std::expected<std::vector<float>, core::error>;

    /** \brief Level assigned to a node at creation, or not_found. */
    auto node_level(std::string_view id) const
        -> std::expected<std::uint32_t, core::error>;

    /** \brief Neighbor ids at a layer; empty above the node's level. */
    auto get_neighbors(std::string_view id, std::uint32_t layer) const
        -> std::expected<std::vector<std::string>, core::error>;

    /** \brief Id of the node every search starts from. */
    auto entry_point() const -> std::optional<std::string>;

    /** \brief Highest level among live nodes, 0 when empty. */
    auto max_level() const noexcept -> std::uint32_t;

    /** \brief Get index statistics. */
    auto get_stats() const noexcept -> HnswStats;

    /** \brief Compute reachability on base layer via BFS (testing/diagnostics). */
    auto reachable_count_base_layer() const -> std::size_t;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/** \brief Compute recall of an HNSW index against ground truth.
 *
 * \param index Built HNSW index
 * \param queries Test queries [n_queries x dim], row-major
 * \param ground_truth Exact top-k ids per query
 * \param k Number of neighbors to evaluate
 * \param ef_search Beam width; 0 uses the index default
 * \return Recall@k in [0, 1]; 0 when searching fails
 */
auto compute_recall(const HnswIndex& index,
                    std::span<const float> queries,
                    const std::vector<std::vector<std::string>>& ground_truth,
                    std::size_t k, std::uint32_t ef_search = 0) -> float;

} // namespace strata::index
