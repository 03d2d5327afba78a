#pragma once

/** \file bruteforce.hpp
 *  \brief Exact cosine scan over a flat vector store.
 *
 * Reference index with the same id and match types as HnswIndex. Used as
 * ground truth for recall measurement and as a correctness baseline.
 * Embeddings are stored row-major in one contiguous buffer; removal moves the
 * last row into the freed one.
 */

#include <cstddef>
#include <expected>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "strata/error.hpp"
#include "strata/index/types.hpp"

namespace strata::index {

class BruteForceIndex {
public:
    /** \brief dim must be > 0; a zero dimension makes every add fail. */
    explicit BruteForceIndex(std::size_t dim);

    /** \brief Insert or overwrite. Fails with dimension_mismatch or invalid_argument. */
    auto add(std::string_view id, std::span<const float> vector)
        -> std::expected<void, core::error>;

    /** \brief No-op when absent. */
    auto remove(std::string_view id) -> void;

    /** \brief Exact top-k by descending similarity, filtered by threshold. */
    auto search(std::span<const float> query, std::size_t k,
                float threshold = kDefaultThreshold) const
        -> std::expected<std::vector<SearchMatch>, core::error>;

    /** \brief Ids of the exact top-k, ignoring any threshold. */
    auto ground_truth(std::span<const float> query, std::size_t k) const
        -> std::expected<std::vector<std::string>, core::error>;

    auto size() const noexcept -> std::size_t { return ids_.size(); }
    auto dimension() const noexcept -> std::size_t { return dim_; }

private:
    struct IdHash {
        using is_transparent = void;
        auto operator()(std::string_view s) const noexcept -> std::size_t {
            return std::hash<std::string_view>{}(s);
        }
    };

    auto row(std::size_t r) const noexcept -> std::span<const float> {
        return {data_.data() + r * dim_, dim_};
    }

    std::size_t dim_;
    std::vector<float> data_;
    std::vector<std::string> ids_;
    std::unordered_map<std::string, std::size_t, IdHash, std::equal_to<>> id_to_row_;
};

} // namespace strata::index
