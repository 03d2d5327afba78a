#include "strata/index/neighbor_selector.hpp"

#include <algorithm>

namespace strata::index {

auto select_closest(std::vector<Candidate> candidates, std::uint32_t max_neighbors)
    -> std::vector<Candidate> {
    const std::size_t keep = std::min<std::size_t>(max_neighbors, candidates.size());
    std::partial_sort(candidates.begin(), candidates.begin() + keep, candidates.end());
    candidates.resize(keep);
    return candidates;
}

auto select_diverse(std::vector<Candidate> candidates, std::uint32_t max_neighbors,
                    const std::function<float(std::uint32_t, std::uint32_t)>& pair_distance)
    -> std::vector<Candidate> {
    if (candidates.empty() || max_neighbors == 0) {
        return {};
    }
    std::sort(candidates.begin(), candidates.end());

    std::vector<Candidate> kept;
    std::vector<Candidate> discarded;
    kept.reserve(max_neighbors);

    for (const auto& c : candidates) {
        if (kept.size() >= max_neighbors) break;

        bool diverse = true;
        for (const auto& r : kept) {
            if (pair_distance(c.second, r.second) < c.first) {
                diverse = false;
                break;
            }
        }
        if (diverse) {
            kept.push_back(c);
        } else {
            discarded.push_back(c);
        }
    }

    for (std::size_t i = 0; i < discarded.size() && kept.size() < max_neighbors; ++i) {
        kept.push_back(discarded[i]);
    }

    std::sort(kept.begin(), kept.end());
    return kept;
}

} // namespace strata::index
