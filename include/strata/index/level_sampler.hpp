#pragma once

/** \file level_sampler.hpp
 *  \brief Random layer assignment for new HNSW nodes.
 *
 * Levels follow the exponentially decaying distribution of the HNSW paper:
 * level = floor(-ln(U) * mL) with U uniform in (0, 1]. With mL = 1 / ln(M),
 * P(level >= l) = M^-l, so each layer holds about 1/M of the nodes of the
 * layer below. Levels are capped at kMaxLevel.
 */

#include <cstdint>
#include <random>

namespace strata::index {

class LevelSampler {
public:
    /** \brief Highest level ever assigned; bounds worst-case descent cost. */
    static constexpr std::uint32_t kMaxLevel = 16;

    /** \brief Standard normalization constant 1 / ln(M). Requires M >= 2. */
    static auto default_level_mult(std::uint32_t M) noexcept -> double;

    LevelSampler(double level_mult, std::uint32_t seed);

    /** \brief Draw the level for one new node. */
    auto sample() -> std::uint32_t;

    auto reseed(std::uint32_t seed) -> void;

    auto level_mult() const noexcept -> double { return level_mult_; }

private:
    double level_mult_;
    std::mt19937 rng_;
    std::uniform_real_distribution<double> unit_{0.0, 1.0};
};

} // namespace strata::index
