#include <algorithm>
#include <cmath>

#include <yaml-cpp/yaml.h>
#include <xct/geometry/Project.hpp>

#include "Catch.hpp"
#include "Utils.hpp"

using namespace ::xct;

namespace {
    const std::vector<f64> ANGLES{0., 0.4, 1.3, 2., 2.9, 3.5, 4.4, 5.9};

    auto load_geometry(const std::string& name, std::vector<f64> angles) -> geometry::ParallelGeometry {
        const YAML::Node node = YAML::LoadFile((test::XCT_ASSETS_PATH / "tests.yaml").string())["project"][name];
        return geometry::parallel_beam_geometry(
            Grid(node["shape"].as<std::vector<i64>>(), node["spacing"].as<std::vector<f64>>()),
            Grid(node["detector_shape"].as<std::vector<i64>>(), node["detector_spacing"].as<std::vector<f64>>()),
            std::move(angles));
    }

    auto make_volume(const Grid& grid) -> VolumeField {
        std::vector<f32> values(static_cast<usize>(grid.n_elements()));
        for (usize i{}; i < values.size(); ++i)
            values[i] = static_cast<f32>(i % 7) * 0.5f;
        return {grid, std::move(values)};
    }

    auto make_sinogram(const geometry::ParallelGeometry& geometry) -> Sinogram {
        const Grid grid = geometry::sinogram_grid(geometry);
        Sinogram sinogram(grid);
        const i64 n_angles = geometry.n_angles();
        for (i64 i{}; i < grid.n_elements(); ++i)
            sinogram.span()[static_cast<usize>(i)] = static_cast<f32>(i / n_angles) + 10 * static_cast<f32>(i % n_angles);
        return sinogram;
    }

    auto sum(std::span<const f32> values) -> f32 {
        f32 output{0};
        for (f32 value: values)
            output += value;
        return output;
    }

    auto sorted(std::vector<f64> values) -> std::vector<f64> {
        std::sort(values.begin(), values.end());
        return values;
    }
}

TEST_CASE("geometry::forward_project(), isotropic", "[xct][geometry]") {
    const geometry::ParallelGeometry geometry = load_geometry("isotropic_3d", ANGLES);
    const VolumeField volume = make_volume(geometry.sample);
    const bool thread_safe = GENERATE(false, true);
    test::FakeProjector projector(thread_safe);

    const Sinogram sinogram = geometry::forward_project(geometry, volume, projector);
    REQUIRE(sinogram.grid() == geometry::sinogram_grid(geometry));

    // A single call for all angles.
    const std::vector<test::FakeProjector::Run> runs = projector.runs();
    REQUIRE(runs.size() == 1);
    REQUIRE(runs[0].algorithm == Algorithm::FP3D_CUDA);
    REQUIRE(runs[0].angles == ANGLES);
    REQUIRE(runs[0].detector_shape == std::vector<i64>{5, 3});
    REQUIRE_THAT(runs[0].detector_spacing[0], Catch::Matchers::WithinRel(0.5, 1e-12)); // 1 / sx
    REQUIRE_THAT(runs[0].detector_spacing[1], Catch::Matchers::WithinRel(2., 1e-12)); // 1 / sz

    // Scaled by sx.
    const f32 volume_sum = sum(volume.span());
    const i64 n_angles = geometry.n_angles();
    for (i64 pixel{}; pixel < 15; ++pixel) {
        for (i64 k{}; k < n_angles; ++k) {
            const f32 expected = (volume_sum + 100 * static_cast<f32>(pixel) +
                                  static_cast<f32>(ANGLES[static_cast<usize>(k)])) * 2;
            REQUIRE_THAT(sinogram.span()[static_cast<usize>(pixel * n_angles + k)],
                         Catch::Matchers::WithinRel(expected, 1e-6f));
        }
    }

    REQUIRE(projector.n_allocated() == 2);
    REQUIRE(projector.n_alive() == 0);
}

TEST_CASE("geometry::forward_project(), anisotropic", "[xct][geometry]") {
    const auto [name, backend, a, b, c, algorithm] = GENERATE(
        table<const char*, const char*, f64, f64, f64, Algorithm>({
            {"anisotropic_2d", "cpu", 1., 0.5, 1., Algorithm::FP},
            {"anisotropic_2d", "gpu", 1., 0.5, 1., Algorithm::FP_CUDA},
            {"anisotropic_3d", "gpu", 2., 1., 0.5, Algorithm::FP3D_CUDA},
        }));
    const auto [thread_safe, n_threads] = GENERATE(table<bool, i64>({{false, 4}, {true, 1}, {true, 3}}));
    INFO("geometry=" << name << ", thread_safe=" << thread_safe << ", n_threads=" << n_threads);

    const geometry::ParallelGeometry geometry = load_geometry(name, ANGLES);
    const VolumeField volume = make_volume(geometry.sample);
    test::FakeProjector projector(thread_safe);

    const std::vector<geometry::ScalingResult> expected = geometry::scale_angles(a, b, ANGLES);
    std::vector<i64> traced;
    const geometry::ProjectionOptions options{
        .backend = Backend(backend),
        .n_threads = n_threads,
        .trace = [&](i64 index, f64 angle, const geometry::ScalingResult& result) {
            traced.push_back(index);
            REQUIRE(angle == ANGLES[static_cast<usize>(index)]);
            REQUIRE(result.corrected_angle == expected[static_cast<usize>(index)].corrected_angle);
            REQUIRE(result.scale_factor == expected[static_cast<usize>(index)].scale_factor);
        },
    };
    const Sinogram sinogram = geometry::forward_project(geometry, volume, projector, options);
    REQUIRE(sinogram.grid() == geometry::sinogram_grid(geometry));
    REQUIRE(traced == std::vector<i64>{0, 1, 2, 3, 4, 5, 6, 7});

    // One call per angle, with the corrected angle and the scaled detector spacing.
    const std::vector<test::FakeProjector::Run> runs = projector.runs();
    REQUIRE(runs.size() == ANGLES.size());
    std::vector<f64> run_angles;
    for (const auto& run: runs) {
        REQUIRE(run.algorithm == algorithm);
        REQUIRE(run.angles.size() == 1);
        run_angles.push_back(run.angles[0]);

        const auto iter = std::find_if(expected.begin(), expected.end(), [&](const auto& result) {
            return result.corrected_angle == run.angles[0];
        });
        REQUIRE(iter != expected.end());
        REQUIRE_THAT(run.detector_spacing[0],
                     Catch::Matchers::WithinRel(geometry.detector.spacing(0) * iter->pixel_scale, 1e-12));
        if (geometry.ndim() == 3)
            REQUIRE_THAT(run.detector_spacing[1], Catch::Matchers::WithinRel(geometry.detector.spacing(1) * c, 1e-12));
    }
    std::vector<f64> expected_angles;
    for (const auto& result: expected)
        expected_angles.push_back(result.corrected_angle);
    if (not thread_safe or n_threads == 1)
        REQUIRE(run_angles == expected_angles); // sequential, in angle order
    REQUIRE(sorted(run_angles) == sorted(expected_angles));

    // Each projection is scaled by its own scale factor and placed at its angle position.
    const f32 volume_sum = sum(volume.span());
    const i64 n_angles = geometry.n_angles();
    const i64 n_pixels = geometry.detector.n_elements();
    for (i64 pixel{}; pixel < n_pixels; ++pixel) {
        for (i64 k{}; k < n_angles; ++k) {
            const geometry::ScalingResult& result = expected[static_cast<usize>(k)];
            const f32 value = (volume_sum + 100 * static_cast<f32>(pixel) + static_cast<f32>(result.corrected_angle)) *
                              static_cast<f32>(result.scale_factor);
            REQUIRE_THAT(sinogram.span()[static_cast<usize>(pixel * n_angles + k)],
                         Catch::Matchers::WithinRel(value, 1e-6f));
        }
    }

    // The volume is uploaded once.
    REQUIRE(projector.n_allocated() == 1 + n_angles);
    REQUIRE(projector.n_alive() == 0);
}

TEST_CASE("geometry::backward_project(), isotropic", "[xct][geometry]") {
    const geometry::ParallelGeometry geometry = load_geometry("isotropic_3d", ANGLES);
    const Sinogram sinogram = make_sinogram(geometry);
    test::FakeProjector projector;

    const VolumeField volume = geometry::backward_project(geometry, sinogram, projector);
    REQUIRE(volume.grid() == geometry.sample);

    const std::vector<test::FakeProjector::Run> runs = projector.runs();
    REQUIRE(runs.size() == 1);
    REQUIRE(runs[0].algorithm == Algorithm::BP3D_CUDA);
    REQUIRE(runs[0].angles == ANGLES);
    REQUIRE_THAT(runs[0].detector_spacing[0], Catch::Matchers::WithinRel(2., 1e-12)); // sx
    REQUIRE_THAT(runs[0].detector_spacing[1], Catch::Matchers::WithinRel(0.5, 1e-12)); // sz

    const f32 expected = (sum(sinogram.span()) + static_cast<f32>(ANGLES[0])) * 0.5f;
    for (f32 value: volume.span())
        REQUIRE_THAT(value, Catch::Matchers::WithinRel(expected, 1e-6f));

    REQUIRE(projector.n_allocated() == 2);
    REQUIRE(projector.n_alive() == 0);
}

TEST_CASE("geometry::backward_project(), anisotropic", "[xct][geometry]") {
    const auto [name, a, b, c, algorithm] = GENERATE(table<const char*, f64, f64, f64, Algorithm>({
        {"anisotropic_2d", 1., 2., 1., Algorithm::BP_CUDA},
        {"anisotropic_3d", 0.5, 1., 2., Algorithm::BP3D_CUDA},
    }));
    INFO("geometry=" << name);

    const geometry::ParallelGeometry geometry = load_geometry(name, ANGLES);
    const Sinogram sinogram = make_sinogram(geometry);
    const i64 n_angles = geometry.n_angles();
    const i64 n_pixels = geometry.detector.n_elements();

    test::FakeProjector projector;
    const VolumeField volume = geometry::backward_project(geometry, sinogram, projector);
    REQUIRE(volume.grid() == geometry.sample);

    // One call per angle, in angle order.
    const std::vector<geometry::ScalingResult> expected = geometry::scale_angles(a, b, ANGLES);
    const std::vector<test::FakeProjector::Run> runs = projector.runs();
    REQUIRE(runs.size() == ANGLES.size());
    for (usize k{}; k < runs.size(); ++k) {
        REQUIRE(runs[k].algorithm == algorithm);
        REQUIRE(runs[k].angles == std::vector<f64>{expected[k].corrected_angle});
        REQUIRE_THAT(runs[k].detector_spacing[0],
                     Catch::Matchers::WithinRel(sinogram.spacing()[0] * expected[k].pixel_scale, 1e-12));
        if (geometry.ndim() == 3)
            REQUIRE_THAT(runs[k].detector_spacing[1], Catch::Matchers::WithinRel(sinogram.spacing()[1] * c, 1e-12));
    }

    // Sum of the scaled backprojections.
    f32 expected_value{0};
    for (i64 k{}; k < n_angles; ++k) {
        f32 projection_sum{0};
        for (i64 p{}; p < n_pixels; ++p)
            projection_sum += sinogram.span()[static_cast<usize>(p * n_angles + k)];
        const geometry::ScalingResult& result = expected[static_cast<usize>(k)];
        expected_value += (projection_sum + static_cast<f32>(result.corrected_angle)) *
                          static_cast<f32>(result.scale_factor);
    }
    for (f32 value: volume.span())
        REQUIRE_THAT(value, Catch::Matchers::WithinRel(expected_value, 1e-5f));

    REQUIRE(projector.n_allocated() == 2 * n_angles);
    REQUIRE(projector.n_alive() == 0);
}

TEST_CASE("geometry::backward_project(), deterministic reduction", "[xct][geometry]") {
    const geometry::ParallelGeometry geometry = load_geometry("anisotropic_3d", ANGLES);
    const Sinogram sinogram = make_sinogram(geometry);

    test::FakeProjector sequential_projector(false);
    const VolumeField expected = geometry::backward_project(geometry, sinogram, sequential_projector);

    const i64 n_threads = GENERATE(2, 3, 8);
    test::FakeProjector projector(true);
    const VolumeField result = geometry::backward_project(geometry, sinogram, projector, {.n_threads = n_threads});
    REQUIRE(projector.n_runs() == geometry.n_angles());
    REQUIRE(projector.n_alive() == 0);
    for (i64 i{}; i < result.n_elements(); ++i)
        REQUIRE(result.span()[static_cast<usize>(i)] == expected.span()[static_cast<usize>(i)]);

    // Every batch is dispatched to the same workers.
    REQUIRE(projector.n_threads_used() <= std::min(n_threads, geometry.n_angles()));
}

TEST_CASE("geometry::forward_project(), geometry::backward_project(), spacings with equal reciprocals",
          "[xct][geometry]") {
    // Distinct spacings whose reciprocals are equal in double precision.
    constexpr f64 sx = 1.737831420398359;
    constexpr f64 sy = 1.7378314203983591;
    static_assert(sx != sy);
    REQUIRE(1 / sx == 1 / sy);

    const geometry::ParallelGeometry geometry = geometry::parallel_beam_geometry(
        Grid({4, 6}, {sx, sy}), Grid(std::vector<i64>{5}, std::vector<f64>{0.5}), {0.1, 1.2, 2.3});

    i64 n_traced{};
    const geometry::ProjectionOptions options{
        .backend = Backend::CPU,
        .trace = [&n_traced](i64, f64, const geometry::ScalingResult&) { ++n_traced; },
    };

    test::FakeProjector forward_projector;
    const Sinogram sinogram = geometry::forward_project(
        geometry, make_volume(geometry.sample), forward_projector, options);
    REQUIRE(forward_projector.n_runs() == geometry.n_angles());
    REQUIRE(n_traced == geometry.n_angles());

    test::FakeProjector backward_projector;
    const VolumeField volume = geometry::backward_project(geometry, sinogram, backward_projector, options);
    REQUIRE(backward_projector.n_runs() == geometry.n_angles());
    REQUIRE(volume.grid() == geometry.sample);
}

TEST_CASE("geometry::forward_project(), geometry::backward_project(), no angles", "[xct][geometry]") {
    const std::string name = GENERATE("anisotropic_2d", "isotropic_3d", "anisotropic_3d");
    const geometry::ParallelGeometry geometry = load_geometry(name, {});
    test::FakeProjector projector(true);
    bool traced{false};
    const geometry::ProjectionOptions options{.trace = [&](i64, f64, const geometry::ScalingResult&) { traced = true; }};

    const Sinogram sinogram = geometry::forward_project(geometry, make_volume(geometry.sample), projector, options);
    REQUIRE(sinogram.is_empty());
    REQUIRE(sinogram.ndim() == geometry.ndim());
    REQUIRE(sinogram.shape().back() == 0);

    const VolumeField volume = geometry::backward_project(geometry, sinogram, projector, options);
    REQUIRE(volume.grid() == geometry.sample);
    for (f32 value: volume.span())
        REQUIRE(value == 0);

    REQUIRE(projector.n_runs() == 0);
    REQUIRE(projector.n_allocated() == 0);
    REQUIRE(not traced);
}

TEST_CASE("geometry::forward_project(), geometry::backward_project(), invalid inputs", "[xct][geometry]") {
    test::FakeProjector projector;

    AND_THEN("cpu backend with 3d geometries") {
        const std::string name = GENERATE("isotropic_3d", "anisotropic_3d");
        const geometry::ParallelGeometry geometry = load_geometry(name, ANGLES);
        const geometry::ProjectionOptions options{.backend = Backend(" CPU ")};
        REQUIRE_THROWS_AS(geometry::forward_project(geometry, make_volume(geometry.sample), projector, options),
                          NotImplementedError);
        REQUIRE_THROWS_AS(geometry::backward_project(geometry, make_sinogram(geometry), projector, options),
                          NotImplementedError);
    }

    AND_THEN("volume not sampled on the sample grid") {
        const geometry::ParallelGeometry geometry = load_geometry("anisotropic_2d", ANGLES);
        const VolumeField volume(Grid({4, 6}, {1., 1.}));
        REQUIRE_THROWS_AS(geometry::forward_project(geometry, volume, projector), ValueError);
    }

    AND_THEN("sinogram not matching the geometry") {
        const geometry::ParallelGeometry geometry = load_geometry("anisotropic_2d", ANGLES);
        const Sinogram sinogram(Grid({5, 7}, {0.5, 1.}));
        REQUIRE_THROWS_AS(geometry::backward_project(geometry, sinogram, projector), ValueError);
    }

    AND_THEN("invalid geometry") {
        const geometry::ParallelGeometry geometry{Grid({4, 4}, {1., 1.}), Grid({4, 4}, {1., 1.}), ANGLES};
        REQUIRE_THROWS_AS(geometry::forward_project(geometry, make_volume(geometry.sample), projector), ValueError);
    }

    REQUIRE(projector.n_runs() == 0);
    REQUIRE(projector.n_allocated() == 0);
}

TEST_CASE("geometry::forward_project(), geometry::backward_project(), projector failure", "[xct][geometry]") {
    const auto [thread_safe, n_threads] = GENERATE(table<bool, i64>({{false, 1}, {true, 4}}));
    const geometry::ParallelGeometry geometry = load_geometry("anisotropic_2d", ANGLES);

    // Forward and backward projections use reciprocal scale factors.
    const bool is_forward = GENERATE(true, false);
    const f64 sx = geometry.sample.spacing(0);
    const f64 sy = geometry.sample.spacing(1);
    const f64 a = is_forward ? 1 / sx : sx;
    const f64 b = is_forward ? 1 / sy : sy;
    const f64 first_failure = geometry::scale_angle(a, b, ANGLES[3]).corrected_angle;
    const f64 second_failure = geometry::scale_angle(a, b, ANGLES[6]).corrected_angle;

    test::FakeProjector projector(thread_safe);
    projector.fail_on_angle = [=](f64 angle) { return angle == first_failure or angle == second_failure; };

    const geometry::ProjectionOptions options{.backend = Backend::CPU, .n_threads = n_threads};
    try {
        if (is_forward)
            static_cast<void>(geometry::forward_project(geometry, make_volume(geometry.sample), projector, options));
        else
            static_cast<void>(geometry::backward_project(geometry, make_sinogram(geometry), projector, options));
        FAIL("the projection should have failed");
    } catch (const test::ProjectorFailure& e) {
        if (not thread_safe) {
            // Sequential: the remaining angles are skipped and the first failure is propagated.
            REQUIRE(std::string(e.what()) == fmt::format("failed to project angle={}", first_failure));
            REQUIRE(projector.n_runs() == 4);
        }
    }
    REQUIRE(projector.n_runs() <= geometry.n_angles());
    REQUIRE(projector.n_alive() == 0);
    REQUIRE(projector.n_released() == projector.n_allocated());
}
