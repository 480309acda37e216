#include <benchmark/benchmark.h>

#include <numbers>
#include <vector>

#include <xct/core/geometry/AngleScaling.hpp>

using namespace ::xct::types;
namespace xg = xct::geometry;

namespace {
    auto make_angles(i64 n_angles) -> std::vector<f64> {
        std::vector<f64> angles(static_cast<usize>(n_angles));
        const f64 step = 2 * std::numbers::pi_v<f64> / static_cast<f64>(n_angles);
        for (usize i{}; i < angles.size(); ++i)
            angles[i] = static_cast<f64>(i) * step;
        return angles;
    }

    void bench000_scale_angle(benchmark::State& state) {
        f64 angle{0.3};
        for (auto _: state) {
            const xg::ScalingResult result = xg::scale_angle(2., 0.5, angle);
            ::benchmark::DoNotOptimize(result);
            angle += 0.01;
        }
    }

    void bench001_scale_angles(benchmark::State& state) {
        const std::vector<f64> angles = make_angles(state.range(0));
        for (auto _: state) {
            std::vector<xg::ScalingResult> results = xg::scale_angles(1.5, 0.75, angles);
            ::benchmark::DoNotOptimize(results.data());
        }
        state.SetItemsProcessed(state.iterations() * state.range(0));
    }
}

BENCHMARK(bench000_scale_angle);
BENCHMARK(bench001_scale_angles)->RangeMultiplier(4)->Range(16, 16384);
