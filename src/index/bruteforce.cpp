#include "strata/index/bruteforce.hpp"
#include "strata/kernels/distance.hpp"
#include "strata/kernels/metric.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace strata::index {

namespace {
constexpr const char* kComponent = "index.bruteforce";
}

BruteForceIndex::BruteForceIndex(std::size_t dim) : dim_(dim) {}

auto BruteForceIndex::add(std::string_view id, std::span<const float> vector)
    -> std::expected<void, core::error> {
    if (id.empty()) {
        return std::unexpected(core::error{core::error_code::invalid_argument, "ID must not be empty", kComponent});
    }
    if (dim_ == 0) {
        return std::unexpected(core::error{core::error_code::config_invalid, "Dimension must be > 0", kComponent});
    }
    if (auto ok = kernels::check_dimension(vector, dim_, "vector", kComponent); !ok) {
        return std::unexpected(std::move(ok.error()));
    }

    if (const auto it = id_to_row_.find(id); it != id_to_row_.end()) {
        std::copy(vector.begin(), vector.end(), data_.begin() + static_cast<std::ptrdiff_t>(it->second * dim_));
        return {};
    }

    data_.insert(data_.end(), vector.begin(), vector.end());
    ids_.emplace_back(id);
    id_to_row_.emplace(ids_.back(), ids_.size() - 1);
    return {};
}

auto BruteForceIndex::remove(std::string_view id) -> void {
    const auto it = id_to_row_.find(id);
    if (it == id_to_row_.end()) return;

    const std::size_t r = it->second;
    const std::size_t last = ids_.size() - 1;
    id_to_row_.erase(it);

    if (r != last) {
        std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(last * dim_), dim_,
                    data_.begin() + static_cast<std::ptrdiff_t>(r * dim_));
        ids_[r] = std::move(ids_[last]);
        id_to_row_[ids_[r]] = r;
    }
    data_.resize(last * dim_);
    ids_.pop_back();
}

auto BruteForceIndex::search(std::span<const float> query, std::size_t k, float threshold) const
    -> std::expected<std::vector<SearchMatch>, core::error> {
    if (auto ok = kernels::check_dimension(query, dim_, "query", kComponent); !ok) {
        return std::unexpected(std::move(ok.error()));
    }

    std::vector<std::pair<float, std::size_t>> scored;
    scored.reserve(ids_.size());
    for (std::size_t r = 0; r < ids_.size(); ++r) {
        const float dist = kernels::cosine_distance(query, row(r));
        if (1.0f - dist >= threshold) {
            scored.emplace_back(dist, r);
        }
    }

    const std::size_t kk = std::min(k, scored.size());
    std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(kk), scored.end());

    std::vector<SearchMatch> out;
    out.reserve(kk);
    for (std::size_t i = 0; i < kk; ++i) {
        out.push_back(SearchMatch{ids_[scored[i].second], scored[i].first, 1.0f - scored[i].first});
    }
    return out;
}

auto BruteForceIndex::ground_truth(std::span<const float> query, std::size_t k) const
    -> std::expected<std::vector<std::string>, core::error> {
    auto matches = search(query, k, -std::numeric_limits<float>::infinity());
    if (!matches) {
        return std::unexpected(std::move(matches.error()));
    }
    std::vector<std::string> ids;
    ids.reserve(matches->size());
    for (auto& m : *matches) {
        ids.push_back(std::move(m.id));
    }
    return ids;
}

} // namespace strata::index
