#include "strata/index/level_sampler.hpp"

#include <cmath>

namespace strata::index {

auto LevelSampler::default_level_mult(std::uint32_t M) noexcept -> double {
    return 1.0 / std::log(static_cast<double>(M));
}

LevelSampler::LevelSampler(double level_mult, std::uint32_t seed)
    : level_mult_(level_mult), rng_(seed) {}

auto LevelSampler::sample() -> std::uint32_t {
    // unit_ yields [0, 1); 1 - u keeps the argument of log in (0, 1]
    const double u = 1.0 - unit_(rng_);
    const double f = -std::log(u) * level_mult_;
    if (!(f < static_cast<double>(kMaxLevel))) {
        return kMaxLevel;
    }
    return static_cast<std::uint32_t>(f);
}

auto LevelSampler::reseed(std::uint32_t seed) -> void {
    rng_.seed(seed);
    unit_.reset();
}

} // namespace strata::index
