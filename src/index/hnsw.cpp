#include "strata/index/hnsw.hpp"
#include "strata/index/level_sampler.hpp"
#include "strata/kernels/distance.hpp"
#include "strata/kernels/metric.hpp"
#include "strata/core/platform_utils.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <iostream>
#include <limits>
#include <queue>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace strata::index {

namespace {

constexpr const char* kComponent = "index.hnsw";
constexpr std::uint32_t kNoNode = std::numeric_limits<std::uint32_t>::max();

/** \brief Lets id_to_idx_ be probed with std::string_view without a copy. */
struct IdHash {
    using is_transparent = void;
    auto operator()(std::string_view s) const noexcept -> std::size_t {
        return std::hash<std::string_view>{}(s);
    }
};

} // namespace

/** \brief Arena slot. A dead slot has live == false and empty buffers. */
struct HnswNode {
    std::string id;
    std::vector<float> data;
    std::vector<std::vector<std::uint32_t>> neighbors;  // Per level
    std::uint32_t level{0};
    bool live{false};
};

/** \brief Internal implementation of HNSW index. */
class HnswIndex::Impl {
public:
    /** \brief Index configuration and state. */
    struct State {
        bool initialized{false};
        bool debug{false};                 // STRATA_HNSW_DEBUG
        std::size_t dim{0};
        HnswBuildParams params;
        std::size_t n_live{0};
        std::uint32_t entry_point{kNoNode};
        std::uint32_t max_level{0};
        LevelSampler sampler{1.0, 42};
    } state_;

    /** \brief Slot arena; indices are stable until a slot is freed. */
    std::vector<HnswNode> nodes_;
    std::vector<std::uint32_t> free_slots_;
    std::unordered_map<std::string, std::uint32_t, IdHash, std::equal_to<>> id_to_idx_;

    auto init(std::size_t dim, const HnswBuildParams& params)
        -> std::expected<void, core::error>;

    auto add(std::string_view id, std::span<const float> data)
        -> std::expected<void, core::error>;

    auto remove(std::string_view id) -> std::expected<void, core::error>;

    auto search(std::span<const float> query, const HnswSearchParams& params) const
        -> std::expected<std::vector<SearchMatch>, core::error>;

    auto clear() noexcept -> void;

    /** \brief Search layer for nearest neighbors. */
    auto search_layer(std::span<const float> query, std::uint32_t entry_point,
                      std::uint32_t ef, std::uint32_t layer) const
        -> std::vector<Candidate>;

    /** \brief Greedy ef=1 descent from the entry point down to (but excluding) stop_layer. */
    auto descend(std::span<const float> query, std::uint32_t stop_layer) const -> std::uint32_t;

    /** \brief Wire a freshly allocated node into one layer. */
    auto connect_node(std::uint32_t new_idx, std::vector<Candidate> candidates,
                      std::uint32_t layer) -> void;

    /** \brief Shrink a node's adjacency at one layer back to M. */
    auto prune_connections(std::uint32_t idx, std::uint32_t layer) -> void;

    auto select_neighbors(std::vector<Candidate> candidates) const -> std::vector<Candidate>;

    auto allocate_slot(std::string_view id, std::span<const float> data,
                       std::uint32_t level) -> std::uint32_t;

    auto promote_entry_point() noexcept -> void;

    auto compute_distance(std::span<const float> query, std::uint32_t idx) const noexcept -> float {
        return kernels::cosine_distance(query, nodes_[idx].data);
    }

    auto pair_distance(std::uint32_t a, std::uint32_t b) const noexcept -> float {
        return kernels::cosine_distance(nodes_[a].data, nodes_[b].data);
    }

    auto find(std::string_view id) const noexcept -> std::uint32_t {
        const auto it = id_to_idx_.find(id);
        return it == id_to_idx_.end() ? kNoNode : it->second;
    }

    auto not_initialized() const -> core::error {
        return core::error{core::error_code::not_initialized, "Index not initialized", kComponent};
    }
};

auto HnswIndex::Impl::init(std::size_t dim, const HnswBuildParams& params)
    -> std::expected<void, core::error> {
    using core::error;
    using core::error_code;

    if (dim == 0) {
        return std::unexpected(error{error_code::config_invalid, "Dimension must be > 0", kComponent});
    }
    if (params.M < 2) {
        return std::unexpected(error{error_code::config_invalid, "M must be >= 2", kComponent});
    }
    if (params.ef_construction < params.M) {
        return std::unexpected(error{error_code::config_invalid, "ef_construction must be >= M", kComponent});
    }
    if (params.ef_search == 0) {
        return std::unexpected(error{error_code::config_invalid, "ef_search must be > 0", kComponent});
    }
    if (!(params.level_mult >= 0.0) || !std::isfinite(params.level_mult)) {
        return std::unexpected(error{error_code::config_invalid, "level_mult must be finite and >= 0", kComponent});
    }

    HnswBuildParams effective = params;
    if (auto v = core::env_u32("STRATA_HNSW_EF_SEARCH"); v && *v > 0) {
        effective.ef_search = *v;
    }
    if (auto v = core::env_u32("STRATA_HNSW_SEED")) {
        effective.seed = *v;
    }
    if (effective.level_mult == 0.0) {
        effective.level_mult = LevelSampler::default_level_mult(effective.M);
    }

    clear();
    state_.dim = dim;
    state_.params = effective;
    state_.sampler = LevelSampler(effective.level_mult, effective.seed);
    state_.debug = core::env_flag("STRATA_HNSW_DEBUG");
    state_.initialized = true;

    if (state_.debug) {
        std::cerr << "[HNSW][init] dim=" << dim << " M=" << effective.M
                  << " ef_construction=" << effective.ef_construction
                  << " ef_search=" << effective.ef_search
                  << " mL=" << effective.level_mult
                  << " seed=" << effective.seed
                  << " selection=" << (effective.selection == NeighborSelection::diverse ? "diverse" : "closest")
                  << std::endl;
    }
    return {};
}

auto HnswIndex::Impl::clear() noexcept -> void {
    nodes_.clear();
    free_slots_.clear();
    id_to_idx_.clear();
    state_.n_live = 0;
    state_.entry_point = kNoNode;
    state_.max_level = 0;
    state_.sampler.reseed(state_.params.seed);
}

auto HnswIndex::Impl::search_layer(std::span<const float> query, std::uint32_t entry_point,
                                   std::uint32_t ef, std::uint32_t layer) const
    -> std::vector<Candidate> {

    const std::size_t N = nodes_.size();

    // Thread-local epoch-based visited marking (avoids hash set overhead)
    struct TLSVisited { std::vector<std::uint32_t> seen; std::uint32_t epoch{0}; };
    thread_local TLSVisited tls;
    if (tls.seen.size() < N) tls.seen.resize(N, 0);
    tls.epoch++;
    if (tls.epoch == 0) {
        std::fill(tls.seen.begin(), tls.seen.end(), 0u);
        tls.epoch = 1;
    }

    // candidates: min-heap on distance; nearest: bounded max-heap holding the best ef
    std::priority_queue<Candidate, std::vector<Candidate>, std::greater<>> candidates;
    std::priority_queue<Candidate> nearest;

    const float entry_dist = compute_distance(query, entry_point);
    candidates.emplace(entry_dist, entry_point);
    nearest.emplace(entry_dist, entry_point);
    tls.seen[entry_point] = tls.epoch;

    while (!candidates.empty()) {
        const auto [current_dist, current] = candidates.top();
        if (nearest.size() >= ef && current_dist > nearest.top().first) {
            break;
        }
        candidates.pop();

        const auto& node = nodes_[current];
        if (layer >= node.neighbors.size()) continue;

        for (std::uint32_t neighbor : node.neighbors[layer]) {
            if (tls.seen[neighbor] == tls.epoch) continue;
            tls.seen[neighbor] = tls.epoch;
            if (!nodes_[neighbor].live) continue;

            const float dist = compute_distance(query, neighbor);
            if (nearest.size() < ef || dist < nearest.top().first) {
                candidates.emplace(dist, neighbor);
                nearest.emplace(dist, neighbor);
                if (nearest.size() > ef) {
                    nearest.pop();
                }
            }
        }
    }

    std::vector<Candidate> result;
    result.reserve(nearest.size());
    while (!nearest.empty()) {
        result.push_back(nearest.top());
        nearest.pop();
    }
    // Heap drains farthest first; ties resolve by slot
    std::reverse(result.begin(), result.end());
    return result;
}

auto HnswIndex::Impl::descend(std::span<const float> query, std::uint32_t stop_layer) const
    -> std::uint32_t {
    std::uint32_t curr_nearest = state_.entry_point;
    for (std::uint32_t lc = state_.max_level; lc > stop_layer; --lc) {
        const auto nearest = search_layer(query, curr_nearest, 1, lc);
        if (!nearest.empty()) {
            curr_nearest = nearest.front().second;
        }
    }
    return curr_nearest;
}

auto HnswIndex::Impl::select_neighbors(std::vector<Candidate> candidates) const
    -> std::vector<Candidate> {
    if (state_.params.selection == NeighborSelection::diverse) {
        return select_diverse(std::move(candidates), state_.params.M,
                              [this](std::uint32_t a, std::uint32_t b) { return pair_distance(a, b); });
    }
    return select_closest(std::move(candidates), state_.params.M);
}

auto HnswIndex::Impl::connect_node(std::uint32_t new_idx, std::vector<Candidate> candidates,
                                   std::uint32_t layer) -> void {
    const auto selected = select_neighbors(std::move(candidates));

    auto& own = nodes_[new_idx].neighbors[layer];
    own.clear();
    own.reserve(selected.size());
    for (const auto& [dist, neighbor] : selected) {
        own.push_back(neighbor);
    }

    for (const auto& [dist, neighbor] : selected) {
        auto& back = nodes_[neighbor].neighbors[layer];
        if (std::find(back.begin(), back.end(), new_idx) == back.end()) {
            back.push_back(new_idx);
        }
        if (back.size() > state_.params.M) {
            prune_connections(neighbor, layer);
        }
    }
}

auto HnswIndex::Impl::prune_connections(std::uint32_t idx, std::uint32_t layer) -> void {
    auto& neighbors = nodes_[idx].neighbors[layer];

    std::vector<Candidate> candidates;
    candidates.reserve(neighbors.size());
    for (std::uint32_t neighbor : neighbors) {
        candidates.emplace_back(pair_distance(idx, neighbor), neighbor);
    }

    const auto kept = select_neighbors(std::move(candidates));
    neighbors.clear();
    for (const auto& [dist, neighbor] : kept) {
        neighbors.push_back(neighbor);
    }
}

auto HnswIndex::Impl::allocate_slot(std::string_view id, std::span<const float> data,
                                    std::uint32_t level) -> std::uint32_t {
    std::uint32_t idx;
    if (!free_slots_.empty()) {
        idx = free_slots_.back();
        free_slots_.pop_back();
    } else {
        idx = static_cast<std::uint32_t>(nodes_.size());
        nodes_.emplace_back();
    }

    auto& node = nodes_[idx];
    node.id.assign(id);
    node.data.assign(data.begin(), data.end());
    node.level = level;
    node.neighbors.assign(level + 1, {});
    node.live = true;

    id_to_idx_.emplace(node.id, idx);
    ++state_.n_live;
    return idx;
}

auto HnswIndex::Impl::add(std::string_view id, std::span<const float> data)
    -> std::expected<void, core::error> {
    using core::error;
    using core::error_code;

    if (!state_.initialized) {
        return std::unexpected(not_initialized());
    }
    if (id.empty()) {
        return std::unexpected(error{error_code::invalid_argument, "ID must not be empty", kComponent});
    }
    if (auto ok = kernels::check_dimension(data, state_.dim, "vector", kComponent); !ok) {
        return std::unexpected(std::move(ok.error()));
    }

    // Existing id: overwrite the vector in place, leave level and edges untouched
    if (const auto existing = find(id); existing != kNoNode) {
        nodes_[existing].data.assign(data.begin(), data.end());
        if (state_.debug) {
            std::cerr << "[HNSW][add] updated vector in place id=" << id << std::endl;
        }
        return {};
    }

    const std::uint32_t level = state_.sampler.sample();
    const std::uint32_t new_idx = allocate_slot(id, data, level);

    // First node becomes entry point
    if (state_.entry_point == kNoNode) {
        state_.entry_point = new_idx;
        state_.max_level = level;
        return {};
    }

    std::uint32_t curr_nearest = descend(data, level);

    for (std::int64_t lc = std::min(level, state_.max_level); lc >= 0; --lc) {
        const auto layer = static_cast<std::uint32_t>(lc);
        auto nearest = search_layer(data, curr_nearest, state_.params.ef_construction, layer);
        if (nearest.empty()) continue;
        const std::uint32_t next = nearest.front().second;
        connect_node(new_idx, std::move(nearest), layer);
        curr_nearest = next;
    }

    if (level > state_.max_level) {
        if (state_.debug) {
            std::cerr << "[HNSW][add] new entry point id=" << id
                      << " level " << state_.max_level << " -> " << level << std::endl;
        }
        state_.entry_point = new_idx;
        state_.max_level = level;
    }
    return {};
}

auto HnswIndex::Impl::promote_entry_point() noexcept -> void {
    std::uint32_t best = kNoNode;
    for (std::uint32_t i = 0; i < nodes_.size(); ++i) {
        if (!nodes_[i].live) continue;
        if (best == kNoNode || nodes_[i].level > nodes_[best].level) {
            best = i;
        }
    }
    state_.entry_point = best;
    state_.max_level = best == kNoNode ? 0 : nodes_[best].level;
}

auto HnswIndex::Impl::remove(std::string_view id) -> std::expected<void, core::error> {
    if (!state_.initialized) {
        return std::unexpected(not_initialized());
    }
    const std::uint32_t idx = find(id);
    if (idx == kNoNode) {
        return {};
    }

    // Strip every edge into idx. Pruning can leave one-way edges, so scan all
    // live nodes rather than only idx's own neighbor lists.
    const std::uint32_t level = nodes_[idx].level;
    for (std::uint32_t i = 0; i < nodes_.size(); ++i) {
        auto& node = nodes_[i];
        if (!node.live || i == idx) continue;
        const std::uint32_t top = std::min(level, node.level);
        for (std::uint32_t layer = 0; layer <= top; ++layer) {
            auto& adj = node.neighbors[layer];
            adj.erase(std::remove(adj.begin(), adj.end(), idx), adj.end());
        }
    }

    id_to_idx_.erase(nodes_[idx].id);
    auto& node = nodes_[idx];
    node.live = false;
    node.id.clear();
    node.data.clear();
    node.data.shrink_to_fit();
    node.neighbors.clear();
    node.level = 0;
    free_slots_.push_back(idx);
    --state_.n_live;

    if (state_.entry_point == idx) {
        promote_entry_point();
        if (state_.debug) {
            std::cerr << "[HNSW][remove] entry point removed; max_level=" << state_.max_level
                      << " live=" << state_.n_live << std::endl;
        }
    }
    return {};
}

auto HnswIndex::Impl::search(std::span<const float> query, const HnswSearchParams& params) const
    -> std::expected<std::vector<SearchMatch>, core::error> {
    if (!state_.initialized) {
        return std::unexpected(not_initialized());
    }
    if (auto ok = kernels::check_dimension(query, state_.dim, "query", kComponent); !ok) {
        return std::unexpected(std::move(ok.error()));
    }

    std::vector<SearchMatch> results;
    if (state_.n_live == 0 || params.k == 0) {
        return results;
    }

    const std::uint32_t curr_nearest = descend(query, 0);

    const std::uint32_t ef_default = params.ef_search != 0 ? params.ef_search : state_.params.ef_search;
    const auto ef = static_cast<std::uint32_t>(std::min<std::size_t>(
        std::max<std::size_t>(params.k, ef_default), std::numeric_limits<std::uint32_t>::max()));
    const auto candidates = search_layer(query, curr_nearest, ef, 0);

    results.reserve(std::min(params.k, candidates.size()));
    for (const auto& [dist, idx] : candidates) {
        if (results.size() >= params.k) break;
        const float similarity = 1.0f - dist;
        if (!(similarity >= params.threshold)) continue;
        results.push_back(SearchMatch{nodes_[idx].id, dist, similarity});
    }
    return results;
}

// HnswIndex public interface implementation

HnswIndex::HnswIndex() : impl_(std::make_unique<Impl>()) {}
HnswIndex::~HnswIndex() = default;
HnswIndex::HnswIndex(HnswIndex&&) noexcept = default;
HnswIndex& HnswIndex::operator=(HnswIndex&&) noexcept = default;

auto HnswIndex::init(std::size_t dim, const HnswBuildParams& params)
    -> std::expected<void, core::error> {
    return impl_->init(dim, params);
}

auto HnswIndex::add(std::string_view id, std::span<const float> vector)
    -> std::expected<void, core::error> {
    return impl_->add(id, vector);
}

auto HnswIndex::remove(std::string_view id) -> std::expected<void, core::error> {
    return impl_->remove(id);
}

auto HnswIndex::search(std::span<const float> query, std::size_t k, float threshold) const
    -> std::expected<std::vector<SearchMatch>, core::error> {
    HnswSearchParams params;
    params.k = k;
    params.threshold = threshold;
    return impl_->search(query, params);
}

auto HnswIndex::search(std::span<const float> query, const HnswSearchParams& params) const
    -> std::expected<std::vector<SearchMatch>, core::error> {
    return impl_->search(query, params);
}

auto HnswIndex::clear() noexcept -> void {
    impl_->clear();
}

auto HnswIndex::size() const noexcept -> std::size_t {
    return impl_->state_.n_live;
}

auto HnswIndex::is_initialized() const noexcept -> bool {
    return impl_->state_.initialized;
}

auto HnswIndex::dimension() const noexcept -> std::size_t {
    return impl_->state_.dim;
}

auto HnswIndex::get_build_params() const noexcept -> HnswBuildParams {
    return impl_->state_.params;
}

auto HnswIndex::contains(std::string_view id) const noexcept -> bool {
    return impl_->find(id) != kNoNode;
}

auto HnswIndex::get_vector(std::string_view id) const
    -> std::expected<std::vector<float>, core::error> {
    const std::uint32_t idx = impl_->find(id);
    if (idx == kNoNode) {
        return std::unexpected(core::error{core::error_code::not_found, "ID not found", kComponent});
    }
    return impl_->nodes_[idx].data;
}

auto HnswIndex::node_level(std::string_view id) const
    -> std::expected<std::uint32_t, core::error> {
    const std::uint32_t idx = impl_->find(id);
    if (idx == kNoNode) {
        return std::unexpected(core::error{core::error_code::not_found, "ID not found", kComponent});
    }
    return impl_->nodes_[idx].level;
}

auto HnswIndex::get_neighbors(std::string_view id, std::uint32_t layer) const
    -> std::expected<std::vector<std::string>, core::error> {
    const std::uint32_t idx = impl_->find(id);
    if (idx == kNoNode) {
        return std::unexpected(core::error{core::error_code::not_found, "ID not found", kComponent});
    }

    std::vector<std::string> result;
    const auto& node = impl_->nodes_[idx];
    if (layer < node.neighbors.size()) {
        result.reserve(node.neighbors[layer].size());
        for (std::uint32_t neighbor : node.neighbors[layer]) {
            result.push_back(impl_->nodes_[neighbor].id);
        }
    }
    return result;
}

auto HnswIndex::entry_point() const -> std::optional<std::string> {
    if (impl_->state_.entry_point == kNoNode) return std::nullopt;
    return impl_->nodes_[impl_->state_.entry_point].id;
}

auto HnswIndex::max_level() const noexcept -> std::uint32_t {
    return impl_->state_.max_level;
}

auto HnswIndex::get_stats() const noexcept -> HnswStats {
    HnswStats stats;
    stats.n_nodes = impl_->state_.n_live;
    stats.n_free_slots = impl_->free_slots_.size();

    std::size_t base_edges = 0;
    std::vector<std::size_t> level_counts;

    stats.memory_bytes = sizeof(Impl);
    stats.memory_bytes += impl_->nodes_.capacity() * sizeof(HnswNode);
    for (const auto& node : impl_->nodes_) {
        if (!node.live) continue;

        if (level_counts.size() <= node.level) {
            level_counts.resize(node.level + 1, 0);
        }
        level_counts[node.level]++;

        // Only count base layer (level 0) edges for degree statistics
        if (!node.neighbors.empty()) {
            base_edges += node.neighbors[0].size();
        }

        stats.memory_bytes += node.id.capacity();
        stats.memory_bytes += node.data.capacity() * sizeof(float);
        for (const auto& neighbors : node.neighbors) {
            stats.memory_bytes += neighbors.capacity() * sizeof(std::uint32_t);
        }
    }

    stats.n_edges = base_edges / 2;
    stats.n_levels = level_counts.size();
    stats.level_counts = std::move(level_counts);
    stats.avg_degree = stats.n_nodes > 0 ?
        static_cast<float>(base_edges) / static_cast<float>(stats.n_nodes) : 0.0f;
    return stats;
}

auto HnswIndex::reachable_count_base_layer() const -> std::size_t {
    const auto& nodes = impl_->nodes_;
    const std::uint32_t ep = impl_->state_.entry_point;
    if (ep == kNoNode) return 0;

    std::vector<char> visited(nodes.size(), 0);
    std::queue<std::uint32_t> q;
    visited[ep] = 1;
    q.push(ep);

    std::size_t count = 0;
    while (!q.empty()) {
        const auto current = q.front();
        q.pop();
        ++count;

        for (std::uint32_t nb : nodes[current].neighbors[0]) {
            if (!nodes[nb].live || visited[nb]) continue;
            visited[nb] = 1;
            q.push(nb);
        }
    }
    return count;
}

auto compute_recall(const HnswIndex& index,
                    std::span<const float> queries,
                    const std::vector<std::vector<std::string>>& ground_truth,
                    std::size_t k, std::uint32_t ef_search) -> float {
    const std::size_t dim = index.dimension();
    if (dim == 0 || k == 0 || ground_truth.empty()) {
        return 0.0f;
    }
    const std::size_t n_queries = std::min(queries.size() / dim, ground_truth.size());
    if (n_queries == 0) {
        return 0.0f;
    }

    HnswSearchParams params;
    params.k = k;
    params.threshold = -std::numeric_limits<float>::infinity();
    params.ef_search = ef_search;

    std::size_t total_found = 0;
    for (std::size_t q = 0; q < n_queries; ++q) {
        auto results = index.search(queries.subspan(q * dim, dim), params);
        if (!results.has_value()) {
            return 0.0f;
        }
        const auto& gt = ground_truth[q];
        const std::size_t gt_k = std::min(k, gt.size());
        const std::unordered_set<std::string_view> truth(gt.begin(), gt.begin() + gt_k);
        for (const auto& match : *results) {
            if (truth.count(match.id) > 0) {
                ++total_found;
            }
        }
    }
    return static_cast<float>(total_found) / static_cast<float>(n_queries * k);
}

} // namespace strata::index
