#include <algorithm>
#include <cmath>
#include <numbers>

#include "xct/core/geometry/AngleScaling.hpp"

namespace {
    using namespace ::xct;

    void check_scale_factors(f64 a, f64 b) {
        check<DomainError>(std::isfinite(a) and a > 0 and std::isfinite(b) and b > 0,
                           "The scale factors should be positive finite numbers, but got a={} and b={}", a, b);
    }

    auto scale_angle_unchecked(f64 a, f64 b, f64 angle) noexcept -> geometry::ScalingResult {
        constexpr f64 PI = std::numbers::pi_v<f64>;

        const auto direction = Vec2<f64>::from_values(std::cos(angle), std::sin(angle));
        const Quadrant quadrant = geometry::quadrant_of(direction);

        const auto scale = Vec2<f64>::from_values(a, b);
        const Vec2<f64> scaled_direction = scale * direction;
        const f64 norm_direction = norm(scaled_direction);
        const Vec2<f64> unit = scaled_direction / norm_direction;

        // Evaluate the inverse function away from its singularity at +-1.
        // asin maps to [-pi/2,pi/2]: reflect into the left half-plane for quadrants 2 and 3.
        // acos maps to [0,pi]: mirror into the lower half-plane for quadrants 3 and 4.
        f64 corrected_angle{};
        Branch branch{};
        if (std::abs(unit[0]) > std::abs(unit[1])) {
            branch = Branch::ASIN;
            corrected_angle = std::asin(unit[1]);
            if (quadrant == Quadrant::SECOND)
                corrected_angle = PI - corrected_angle;
            else if (quadrant == Quadrant::THIRD)
                corrected_angle = -PI - corrected_angle;
        } else {
            branch = Branch::ACOS;
            corrected_angle = std::acos(unit[0]);
            if (quadrant == Quadrant::THIRD or quadrant == Quadrant::FOURTH)
                corrected_angle = -corrected_angle;
        }

        const auto perpendicular = Vec2<f64>::from_values(-direction[1], direction[0]);
        const f64 norm_perpendicular = norm(scale * perpendicular);

        return {
            .corrected_angle = corrected_angle,
            .scale_factor = 1 / norm_direction,
            .pixel_scale = norm_perpendicular,
            .quadrant = quadrant,
            .branch = branch,
        };
    }
}

namespace xct::geometry {
    auto scale_angle(f64 a, f64 b, f64 angle) -> ScalingResult {
        check_scale_factors(a, b);
        return scale_angle_unchecked(a, b, angle);
    }

    auto scale_angles(f64 a, f64 b, std::span<const f64> angles) -> std::vector<ScalingResult> {
        check_scale_factors(a, b);

        std::vector<ScalingResult> output;
        output.reserve(angles.size());
        for (usize i{}; i < angles.size(); ++i) {
            check<ValueError>(std::isfinite(angles[i]), "The angles should be finite, but got angles[{}]={}",
                              i, angles[i]);
            output.push_back(scale_angle_unchecked(a, b, angles[i]));
        }
        return output;
    }
}
