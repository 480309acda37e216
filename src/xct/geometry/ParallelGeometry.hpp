#pragma once

#include <vector>

#include "xct/core/Traits.hpp"
#include "xct/core/types/Grid.hpp"

namespace xct::geometry {
    /// Parallel-beam geometry with a sample rotating about its last axis.
    /// \details The rays travel along the first sample axis at angle 0 and the flat detector faces the source.
    ///          In 3d, the first detector axis lies in the rotation plane and the second one is parallel to the
    ///          rotation axis. In 2d, the detector is a line in the rotation plane.
    struct ParallelGeometry {
        Grid sample;             // 2d or 3d sample grid
        Grid detector;           // detector grid, with one dimension less than the sample
        std::vector<f64> angles; // rotation angles, in radians

        [[nodiscard]] auto ndim() const noexcept -> i64 { return sample.ndim(); }
        [[nodiscard]] auto n_angles() const noexcept -> i64 { return static_cast<i64>(angles.size()); }
    };

    /// Creates a parallel-beam geometry.
    /// \throws ValueError if the geometry is invalid, see check_geometry.
    [[nodiscard]] auto parallel_beam_geometry(
        Grid sample,
        Grid detector,
        std::vector<f64> angles
    ) -> ParallelGeometry;

    /// Checks that the sample grid is 2d or 3d and not empty, that the detector has one dimension less
    /// and is not empty, and that the angles are finite.
    /// \throws ValueError if one of these conditions is not met.
    void check_geometry(const ParallelGeometry& geometry);

    /// Returns the grid of the sinogram of a geometry, i.e. the detector grid followed by the angle axis.
    /// The spacing of the angle axis is 1.
    [[nodiscard]] auto sinogram_grid(const ParallelGeometry& geometry) -> Grid;
}
