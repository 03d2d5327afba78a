#include "strata/kernels/metric.hpp"
#include "strata/kernels/distance.hpp"

#include <string>
#include <utility>

namespace strata::kernels {

auto check_dimension(std::span<const float> v, std::size_t expected_dim,
                     const char* what, const char* component)
    -> std::expected<void, core::error> {
    if (v.size() != expected_dim) {
        return std::unexpected(core::error{
            core::error_code::dimension_mismatch,
            std::string(what) + " has dimension " + std::to_string(v.size()) +
                ", expected " + std::to_string(expected_dim),
            component
        });
    }
    return {};
}

auto cosine_distance_checked(std::span<const float> a, std::span<const float> b)
    -> std::expected<float, core::error> {
    if (auto ok = check_dimension(b, a.size(), "rhs", "kernels.cosine"); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    return cosine_distance(a, b);
}

} // namespace strata::kernels
