#pragma once

#include <functional>

#include "xct/core/Enums.hpp"
#include "xct/core/Traits.hpp"
#include "xct/core/geometry/AngleScaling.hpp"
#include "xct/core/types/Field.hpp"
#include "xct/geometry/ParallelGeometry.hpp"
#include "xct/projector/Projector.hpp"

namespace xct::geometry {
    struct ProjectionOptions {
        /// Backend of the projector. CPU projectors only support 2d geometries.
        Backend backend{Backend::GPU};

        /// Maximum number of threads used to dispatch the angles of anisotropic geometries.
        /// If 0, Session::thread_limit() is used. The angles are always dispatched sequentially if the
        /// projector is not thread-safe.
        i64 n_threads{0};

        /// Optional callback, invoked with (index, angle, scaling) for every angle of an anisotropic geometry,
        /// in angle order and before any projector call.
        std::function<void(i64, f64, const ScalingResult&)> trace{};
    };

    /// Forward projects a volume through a parallel-beam geometry with anisotropic voxels.
    /// \details The projector assumes unit voxels. With a voxel spacing (sx, sy[, sz]), the rotation plane is
    ///          scaled by (a, b) = (1/sx, 1/sy) and the rotation axis by c = 1/sz. If sx == sy, the angles are
    ///          unchanged: the projector is called once for all angles with a detector spacing scaled by (a, c)
    ///          and the projections are scaled by 1/a. Otherwise, each angle is corrected by scale_angles() and
    ///          projected separately with a detector spacing scaled by (pixel_scale, c), and its projection is
    ///          scaled by scale_factor. The volume is uploaded once and shared by every projection.
    /// \param[in] geometry     Parallel-beam geometry. The volume is sampled on the sample grid.
    /// \param[in] volume       Volume to project, indexed by (x, y[, z]).
    /// \param[in,out] projector Projector computing the unit-voxel projections.
    /// \param options          Projection options.
    /// \return The sinogram, indexed by (detector dimensions..., angle). Without angles, the sinogram is empty
    ///         and the projector is not called.
    /// \throws ValueError if the geometry is invalid or if the volume grid is not the sample grid.
    /// \throws NotImplementedError if the backend doesn't support the dimensionality of the geometry.
    /// \note If one angle fails, the remaining angles are skipped, every projector resource is released,
    ///       and the first error, in angle order, is rethrown.
    [[nodiscard]] auto forward_project(
        const ParallelGeometry& geometry,
        const VolumeField& volume,
        Projector& projector,
        const ProjectionOptions& options = {}
    ) -> Sinogram;

    /// Backprojects a sinogram into a volume with anisotropic voxels.
    /// \details Mirror of forward_project(). The scaling factors are the voxel spacing (a, b, c) = (sx, sy, sz),
    ///          and the detector spacing is the spacing of the sinogram. With anisotropic voxels, each angle is
    ///          backprojected separately and the scaled volumes are summed in angle order.
    /// \param[in] geometry     Parallel-beam geometry. The output volume is sampled on the sample grid.
    /// \param[in] sinogram     Sinogram to backproject, with the shape of sinogram_grid(geometry).
    /// \param[in,out] projector Projector computing the unit-voxel backprojections.
    /// \param options          Projection options.
    /// \return The volume, indexed by (x, y[, z]). Without angles, the volume is zero and the projector
    ///         is not called.
    /// \throws ValueError if the geometry is invalid or if the sinogram doesn't match the geometry.
    /// \throws NotImplementedError if the backend doesn't support the dimensionality of the geometry.
    [[nodiscard]] auto backward_project(
        const ParallelGeometry& geometry,
        const Sinogram& sinogram,
        Projector& projector,
        const ProjectionOptions& options = {}
    ) -> VolumeField;
}
