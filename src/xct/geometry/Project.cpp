#include <algorithm>
#include <atomic>
#include <future>
#include <optional>

#include "xct/core/Session.hpp"
#include "xct/core/utils/Threadpool.hpp"
#include "xct/geometry/Project.hpp"

namespace {
    using namespace ::xct;
    using namespace ::xct::geometry;

    /// Scaling of the sample axes: (a, b) span the rotation plane, c is the rotation axis (3d only).
    /// The path is decided on the voxel spacing itself, since distinct spacings can have equal reciprocals.
    struct AxisScaling {
        f64 a;
        f64 b;
        f64 c;
        bool isotropic;

        [[nodiscard]] auto is_isotropic() const noexcept -> bool { return isotropic; }
    };

    auto axis_scaling(const Grid& sample, bool reciprocal) -> AxisScaling {
        const f64 sx = sample.spacing(0);
        const f64 sy = sample.spacing(1);
        const f64 sz = sample.ndim() == 3 ? sample.spacing(2) : 1.;
        if (reciprocal)
            return {1 / sx, 1 / sy, 1 / sz, sx == sy};
        return {sx, sy, sz, sx == sy};
    }

    auto volume_geometry_of(const Grid& sample) -> VolumeGeometry {
        return {sample.shape()};
    }

    /// Detector spacing scaled by (in_plane, along_axis).
    auto scale_detector_spacing(std::vector<f64> spacing, f64 in_plane, f64 along_axis) -> std::vector<f64> {
        spacing[0] *= in_plane;
        if (spacing.size() == 2)
            spacing[1] *= along_axis;
        return spacing;
    }

    auto thread_count(const Projector& projector, const ProjectionOptions& options) -> i64 {
        if (not projector.is_thread_safe())
            return 1;
        const i64 n_threads = options.n_threads > 0 ? options.n_threads : Session::thread_limit();
        return std::max(n_threads, i64{1});
    }

    /// Computes the scaling of every angle, then reports it to the trace hook and the logger, in angle order.
    auto scale_and_trace(
        const AxisScaling& scaling,
        const std::vector<f64>& angles,
        const ProjectionOptions& options
    ) -> std::vector<ScalingResult> {
        std::vector<ScalingResult> output = scale_angles(scaling.a, scaling.b, angles);

        const bool should_log = Session::logger.should_trace();
        for (usize i{}; i < output.size(); ++i) {
            const ScalingResult& result = output[i];
            if (options.trace)
                options.trace(static_cast<i64>(i), angles[i], result);
            if (should_log) {
                Session::logger.trace(
                    "[{}] angle={:.6f}, quadrant={}, branch={}, corrected_angle={:.6f}, "
                    "scale_factor={:.6f}, pixel_scale={:.6f}",
                    i, angles[i], result.quadrant, result.branch, result.corrected_angle,
                    result.scale_factor, result.pixel_scale);
            }
        }
        return output;
    }

    /// Launches the thread pool dispatching the angles, unless they should be processed sequentially.
    void launch_pool(std::optional<ThreadPool>& pool, i64 n_threads, i64 n_angles) {
        if (n_threads > 1 and n_angles > 1)
            pool.emplace(std::min(n_threads, n_angles));
    }

    /// Calls func(i) for every i in [start, end).
    /// \details With a thread pool, the calls are enqueued to the pool. As soon as one call fails, the calls
    ///          that have not started yet are skipped. Once every call is done, the first exception, in index
    ///          order, is rethrown. Otherwise, the calls are made sequentially by the calling thread.
    template<typename Func>
    void for_each_angle(i64 start, i64 end, std::optional<ThreadPool>& pool, Func&& func) {
        if (not pool or end - start <= 1) {
            for (i64 i = start; i < end; ++i)
                func(i);
            return;
        }

        std::atomic<bool> abort{false};
        std::vector<std::future<void>> futures;
        futures.reserve(static_cast<usize>(end - start));
        for (i64 i = start; i < end; ++i) {
            futures.push_back(pool->enqueue([&abort, &func, i] {
                if (abort.load())
                    return;
                try {
                    func(i);
                } catch (...) {
                    abort.store(true);
                    throw;
                }
            }));
        }

        // Wait for every task before rethrowing, since the tasks refer to this frame.
        for (auto& future: futures)
            future.wait();
        for (auto& future: futures)
            future.get();
    }

    void check_forward_parameters(const ParallelGeometry& geometry, const VolumeField& volume) {
        check_geometry(geometry);
        check<ValueError>(volume.grid() == geometry.sample,
                          "The volume should be sampled on the sample grid, but got volume={} and sample={}",
                          volume.grid(), geometry.sample);
    }

    void check_backward_parameters(const ParallelGeometry& geometry, const Sinogram& sinogram) {
        check_geometry(geometry);
        const Grid expected = sinogram_grid(geometry);
        check<ValueError>(sinogram.shape() == expected.shape(),
                          "The sinogram doesn't match the geometry. Expected sinogram:shape={}, but got {}",
                          expected.shape(), sinogram.shape());
    }
}

namespace xct::geometry {
    auto forward_project(
        const ParallelGeometry& geometry,
        const VolumeField& volume,
        Projector& projector,
        const ProjectionOptions& options
    ) -> Sinogram {
        check_forward_parameters(geometry, volume);
        const Algorithm algorithm = Algorithm::select(true, options.backend, geometry.ndim());
        const AxisScaling scaling = axis_scaling(geometry.sample, true);
        const i64 n_angles = geometry.n_angles();

        Session::logger.info("forward_project: backend={}, algorithm={}, n_angles={}, path={}",
                             options.backend, algorithm, n_angles,
                             scaling.is_isotropic() ? "isotropic" : "anisotropic");

        const Grid output_grid = sinogram_grid(geometry);
        if (n_angles == 0)
            return Sinogram(output_grid);

        const VolumeGeometry volume_geometry = volume_geometry_of(geometry.sample);

        if (scaling.is_isotropic()) {
            const ProjectionGeometry projection_geometry{
                geometry.detector.shape(),
                scale_detector_spacing(geometry.detector.spacing(), scaling.a, scaling.c),
                geometry.angles,
            };
            std::vector<f32> output = project_single(
                projector, algorithm, volume.span(), volume_geometry, projection_geometry);

            const auto global_scale = static_cast<f32>(1 / scaling.a);
            for (f32& value: output)
                value *= global_scale;
            return Sinogram(output_grid, std::move(output));
        }

        const std::vector<ScalingResult> results = scale_and_trace(scaling, geometry.angles, options);
        const i64 n_pixels = geometry.detector.n_elements();
        std::vector<f32> output(static_cast<usize>(output_grid.n_elements()));

        const ProjectorData volume_data = allocate_volume(projector, volume_geometry, volume.span());
        std::optional<ThreadPool> pool;
        launch_pool(pool, thread_count(projector, options), n_angles);
        for_each_angle(0, n_angles, pool, [&](i64 i) {
            const ScalingResult& result = results[static_cast<usize>(i)];
            const ProjectionGeometry projection_geometry{
                geometry.detector.shape(),
                scale_detector_spacing(geometry.detector.spacing(), result.pixel_scale, scaling.c),
                {result.corrected_angle},
            };
            const std::vector<f32> projection = project_single(
                projector, algorithm, volume_data, projection_geometry);

            // The angle is the innermost dimension of the sinogram.
            const auto scale = static_cast<f32>(result.scale_factor);
            for (i64 p{}; p < n_pixels; ++p)
                output[static_cast<usize>(p * n_angles + i)] = projection[static_cast<usize>(p)] * scale;
        });
        return Sinogram(output_grid, std::move(output));
    }

    auto backward_project(
        const ParallelGeometry& geometry,
        const Sinogram& sinogram,
        Projector& projector,
        const ProjectionOptions& options
    ) -> VolumeField {
        check_backward_parameters(geometry, sinogram);
        const Algorithm algorithm = Algorithm::select(false, options.backend, geometry.ndim());
        const AxisScaling scaling = axis_scaling(geometry.sample, false);
        const i64 n_angles = geometry.n_angles();

        Session::logger.info("backward_project: backend={}, algorithm={}, n_angles={}, path={}",
                             options.backend, algorithm, n_angles,
                             scaling.is_isotropic() ? "isotropic" : "anisotropic");

        if (n_angles == 0)
            return VolumeField(geometry.sample);

        const VolumeGeometry volume_geometry = volume_geometry_of(geometry.sample);
        const std::vector<i64> detector_shape(sinogram.shape().begin(), sinogram.shape().end() - 1);
        const std::vector<f64> detector_spacing(sinogram.spacing().begin(), sinogram.spacing().end() - 1);

        if (scaling.is_isotropic()) {
            const ProjectionGeometry projection_geometry{
                detector_shape,
                scale_detector_spacing(detector_spacing, scaling.a, scaling.c),
                geometry.angles,
            };
            std::vector<f32> output = backproject_single(
                projector, algorithm, sinogram.span(), projection_geometry, volume_geometry);

            const auto global_scale = static_cast<f32>(1 / scaling.a);
            for (f32& value: output)
                value *= global_scale;
            return VolumeField(geometry.sample, std::move(output));
        }

        const std::vector<ScalingResult> results = scale_and_trace(scaling, geometry.angles, options);
        const i64 n_pixels = geometry.detector.n_elements();
        const i64 n_voxels = volume_geometry.n_elements();
        const std::span<const f32> input = sinogram.span();
        std::vector<f32> output(static_cast<usize>(n_voxels), f32{0});

        // Partial volumes are computed in batches of n_threads and reduced in angle order.
        const i64 n_threads = thread_count(projector, options);
        const i64 batch_size = std::min(n_threads, n_angles);
        std::vector<std::vector<f32>> partial_volumes(static_cast<usize>(batch_size));
        std::optional<ThreadPool> pool;
        launch_pool(pool, n_threads, n_angles);

        for (i64 start{}; start < n_angles; start += batch_size) {
            const i64 end = std::min(start + batch_size, n_angles);

            for_each_angle(start, end, pool, [&](i64 i) {
                const ScalingResult& result = results[static_cast<usize>(i)];
                const ProjectionGeometry projection_geometry{
                    detector_shape,
                    scale_detector_spacing(detector_spacing, result.pixel_scale, scaling.c),
                    {result.corrected_angle},
                };

                std::vector<f32> projection(static_cast<usize>(n_pixels));
                for (i64 p{}; p < n_pixels; ++p)
                    projection[static_cast<usize>(p)] = input[static_cast<usize>(p * n_angles + i)];

                partial_volumes[static_cast<usize>(i - start)] = backproject_single(
                    projector, algorithm, projection, projection_geometry, volume_geometry);
            });

            for (i64 i = start; i < end; ++i) {
                const auto scale = static_cast<f32>(results[static_cast<usize>(i)].scale_factor);
                const std::vector<f32>& partial = partial_volumes[static_cast<usize>(i - start)];
                for (i64 v{}; v < n_voxels; ++v)
                    output[static_cast<usize>(v)] += partial[static_cast<usize>(v)] * scale;
            }
        }
        return VolumeField(geometry.sample, std::move(output));
    }
}
