#pragma once

#include <span>
#include <vector>

#include "xct/core/Enums.hpp"
#include "xct/core/Traits.hpp"
#include "xct/core/types/Vec.hpp"

namespace xct::geometry {
    /// Geometric correction of a single projection angle.
    /// \details The external projectors assume a unit voxel size on every axis. Projecting along the direction
    ///          (cos(t), sin(t)) through a grid with anisotropic voxels is equivalent to projecting along
    ///          diag(a,b) * (cos(t), sin(t)) through a grid with unit voxels, where a and b are the factors mapping
    ///          the physical axes to the voxel axes. The corrected angle is the angle of that scaled direction,
    ///          the scale factor corrects the line-integral parametrization and the pixel scale corrects the
    ///          detector pixel size along the in-plane detector axis.
    struct ScalingResult {
        f64 corrected_angle; // radians, in [-pi, pi]
        f64 scale_factor;    // 1 / ||diag(a,b) * direction||
        f64 pixel_scale;     // ||diag(a,b) * perpendicular||
        Quadrant quadrant;   // quadrant of the input direction
        Branch branch;       // inverse function used to compute the corrected angle
    };

    /// Returns the quadrant of the direction. Ties on zero are resolved toward the nonnegative quadrant.
    [[nodiscard]] constexpr auto quadrant_of(const Vec2<f64>& direction) noexcept -> Quadrant {
        if (direction[0] >= 0)
            return direction[1] >= 0 ? Quadrant::FIRST : Quadrant::FOURTH;
        return direction[1] >= 0 ? Quadrant::SECOND : Quadrant::THIRD;
    }

    /// Computes the corrected angle and scale factors of one projection angle.
    /// \param a        Positive scale factor along the first axis of the rotation plane.
    ///                 Forward projections use the reciprocal voxel size, backprojections the voxel size.
    /// \param b        Positive scale factor along the second axis of the rotation plane.
    /// \param angle    Rotation angle, in radians.
    /// \throws DomainError if \p a or \p b is not a positive finite number.
    [[nodiscard]] auto scale_angle(f64 a, f64 b, f64 angle) -> ScalingResult;

    /// Computes the corrected angle and scale factors of every angle, in the same order.
    /// An empty sequence gives an empty output.
    /// \throws DomainError if \p a or \p b is not a positive finite number.
    /// \throws ValueError if one of the angles is not finite.
    [[nodiscard]] auto scale_angles(f64 a, f64 b, std::span<const f64> angles) -> std::vector<ScalingResult>;
}
