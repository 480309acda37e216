#include <cmath>

#include "xct/core/Error.hpp"
#include "xct/geometry/ParallelGeometry.hpp"

namespace xct::geometry {
    auto parallel_beam_geometry(
        Grid sample,
        Grid detector,
        std::vector<f64> angles
    ) -> ParallelGeometry {
        ParallelGeometry geometry{std::move(sample), std::move(detector), std::move(angles)};
        check_geometry(geometry);
        return geometry;
    }

    void check_geometry(const ParallelGeometry& geometry) {
        const i64 ndim = geometry.sample.ndim();
        check<ValueError>(ndim == 2 or ndim == 3,
                          "The sample grid should be 2d or 3d, but got sample={}", geometry.sample);
        check<ValueError>(geometry.detector.ndim() == ndim - 1,
                          "The detector grid of a {}d geometry should be {}d, but got detector={}",
                          ndim, ndim - 1, geometry.detector);
        check<ValueError>(not geometry.sample.is_empty(), "Empty sample grid: sample={}", geometry.sample);
        check<ValueError>(not geometry.detector.is_empty(), "Empty detector grid: detector={}", geometry.detector);

        for (usize i{}; i < geometry.angles.size(); ++i) {
            check<ValueError>(std::isfinite(geometry.angles[i]),
                              "The angles should be finite, but got angles[{}]={}", i, geometry.angles[i]);
        }
    }

    auto sinogram_grid(const ParallelGeometry& geometry) -> Grid {
        std::vector<i64> shape = geometry.detector.shape();
        std::vector<f64> spacing = geometry.detector.spacing();
        shape.push_back(geometry.n_angles());
        spacing.push_back(1.);
        return {std::move(shape), std::move(spacing)};
    }
}
