#include "xct/projector/Projector.hpp"

namespace xct {
    auto Algorithm::select(bool is_forward, Backend backend, i64 ndim) -> Algorithm {
        check<ValueError>(ndim == 2 or ndim == 3, "Only 2d and 3d projections are supported, but got ndim={}", ndim);
        if (backend.is_cpu()) {
            check<NotImplementedError>(ndim == 2, "No CPU {} projection available for 3d geometries",
                                       is_forward ? "forward" : "backward");
            return is_forward ? FP : BP;
        }
        if (ndim == 2)
            return is_forward ? FP_CUDA : BP_CUDA;
        return is_forward ? FP3D_CUDA : BP3D_CUDA;
    }

    std::ostream& operator<<(std::ostream& os, Algorithm algorithm) {
        switch (algorithm) {
            case Algorithm::FP:
                return os << "FP";
            case Algorithm::BP:
                return os << "BP";
            case Algorithm::FP_CUDA:
                return os << "FP_CUDA";
            case Algorithm::BP_CUDA:
                return os << "BP_CUDA";
            case Algorithm::FP3D_CUDA:
                return os << "FP3D_CUDA";
            case Algorithm::BP3D_CUDA:
                return os << "BP3D_CUDA";
        }
        return os;
    }

    auto allocate_volume(
        Projector& projector,
        const VolumeGeometry& geometry,
        std::span<const f32> values
    ) -> ProjectorData {
        check<ValueError>(values.empty() or static_cast<i64>(values.size()) == geometry.n_elements(),
                          "The volume values ({} elements) don't match the volume shape={}",
                          values.size(), geometry.shape);
        return {projector, projector.allocate_volume(geometry, values)};
    }

    auto allocate_projection(
        Projector& projector,
        const ProjectionGeometry& geometry,
        std::span<const f32> values
    ) -> ProjectorData {
        check<ValueError>(values.empty() or static_cast<i64>(values.size()) == geometry.n_elements(),
                          "The projection values ({} elements) don't match the detector shape={} and n_angles={}",
                          values.size(), geometry.detector_shape, geometry.angles.size());
        return {projector, projector.allocate_projection(geometry, values)};
    }

    auto project_single(
        Projector& projector,
        Algorithm algorithm,
        const ProjectorData& volume,
        const ProjectionGeometry& projection_geometry
    ) -> std::vector<f32> {
        check(algorithm.is_forward(), "{} is not a forward projection", algorithm);
        check(not volume.is_empty(), "The volume is not allocated");

        const ProjectorData projection = allocate_projection(projector, projection_geometry);
        projector.run(algorithm, volume.id(), projection.id());

        std::vector<f32> output(static_cast<usize>(projection_geometry.n_elements()));
        projector.read(projection.id(), output);
        return output;
    }

    auto project_single(
        Projector& projector,
        Algorithm algorithm,
        std::span<const f32> volume,
        const VolumeGeometry& volume_geometry,
        const ProjectionGeometry& projection_geometry
    ) -> std::vector<f32> {
        check<ValueError>(static_cast<i64>(volume.size()) == volume_geometry.n_elements(),
                          "The volume values ({} elements) don't match the volume shape={}",
                          volume.size(), volume_geometry.shape);
        const ProjectorData volume_data = allocate_volume(projector, volume_geometry, volume);
        return project_single(projector, algorithm, volume_data, projection_geometry);
    }

    auto backproject_single(
        Projector& projector,
        Algorithm algorithm,
        std::span<const f32> projection,
        const ProjectionGeometry& projection_geometry,
        const VolumeGeometry& volume_geometry
    ) -> std::vector<f32> {
        check(not algorithm.is_forward(), "{} is not a backprojection", algorithm);
        check<ValueError>(static_cast<i64>(projection.size()) == projection_geometry.n_elements(),
                          "The projection values ({} elements) don't match the detector shape={} and n_angles={}",
                          projection.size(), projection_geometry.detector_shape, projection_geometry.angles.size());

        const ProjectorData projection_data = allocate_projection(projector, projection_geometry, projection);
        const ProjectorData volume_data = allocate_volume(projector, volume_geometry);
        projector.run(algorithm, volume_data.id(), projection_data.id());

        std::vector<f32> output(static_cast<usize>(volume_geometry.n_elements()));
        projector.read(volume_data.id(), output);
        return output;
    }
}
