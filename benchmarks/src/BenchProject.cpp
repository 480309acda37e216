#include <benchmark/benchmark.h>

#include <algorithm>
#include <mutex>
#include <numbers>
#include <unordered_map>
#include <vector>

#include <xct/geometry/Project.hpp>

using namespace ::xct::types;
namespace xg = xct::geometry;

namespace {
    // Projector storing the objects in memory and computing nothing, to measure the cost of
    // the angle correction, the dispatch and the reduction.
    class NullProjector final : public xct::Projector {
    public:
        auto allocate_volume(const xct::VolumeGeometry& geometry, std::span<const f32> values) -> xct::DataId override {
            return allocate_(geometry.n_elements(), values);
        }

        auto allocate_projection(
            const xct::ProjectionGeometry& geometry,
            std::span<const f32> values
        ) -> xct::DataId override {
            return allocate_(geometry.n_elements(), values);
        }

        void run(xct::Algorithm, xct::DataId, xct::DataId) override {}

        void read(xct::DataId id, std::span<f32> output) override {
            const std::scoped_lock lock(m_mutex);
            const std::vector<f32>& values = m_objects.at(id);
            std::copy(values.begin(), values.end(), output.begin());
        }

        void release(xct::DataId id) noexcept override {
            const std::scoped_lock lock(m_mutex);
            m_objects.erase(id);
        }

        [[nodiscard]] auto is_thread_safe() const noexcept -> bool override { return true; }

    private:
        auto allocate_(i64 n_elements, std::span<const f32> values) -> xct::DataId {
            std::vector<f32> buffer(values.begin(), values.end());
            buffer.resize(static_cast<usize>(n_elements));
            const std::scoped_lock lock(m_mutex);
            m_objects.emplace(m_id, std::move(buffer));
            return m_id++;
        }

        std::mutex m_mutex;
        std::unordered_map<xct::DataId, std::vector<f32>> m_objects;
        xct::DataId m_id{1};
    };

    auto make_geometry(std::vector<f64> voxel_spacing, i64 n_angles) -> xg::ParallelGeometry {
        std::vector<f64> angles(static_cast<usize>(n_angles));
        for (usize i{}; i < angles.size(); ++i)
            angles[i] = static_cast<f64>(i) * std::numbers::pi_v<f64> / static_cast<f64>(n_angles);
        return xg::parallel_beam_geometry(
            xct::Grid({128, 128, 64}, std::move(voxel_spacing)),
            xct::Grid({182, 64}, {1., 1.}),
            std::move(angles));
    }

    void bench000_forward_project(benchmark::State& state) {
        const xg::ParallelGeometry geometry = make_geometry({1., 2., 1.}, 61);
        const xct::VolumeField volume(geometry.sample);
        NullProjector projector;
        const xg::ProjectionOptions options{.backend = xct::Backend::GPU, .n_threads = state.range(0)};

        for (auto _: state) {
            xct::Sinogram sinogram = xg::forward_project(geometry, volume, projector, options);
            ::benchmark::DoNotOptimize(sinogram.span().data());
        }
    }

    void bench001_backward_project(benchmark::State& state) {
        const xg::ParallelGeometry geometry = make_geometry({1., 2., 1.}, 61);
        const xct::Sinogram sinogram(xg::sinogram_grid(geometry));
        NullProjector projector;
        const xg::ProjectionOptions options{.backend = xct::Backend::GPU, .n_threads = state.range(0)};

        for (auto _: state) {
            xct::VolumeField volume = xg::backward_project(geometry, sinogram, projector, options);
            ::benchmark::DoNotOptimize(volume.span().data());
        }
    }

    void bench002_forward_project_isotropic(benchmark::State& state) {
        const xg::ParallelGeometry geometry = make_geometry({2., 2., 1.}, 61);
        const xct::VolumeField volume(geometry.sample);
        NullProjector projector;

        for (auto _: state) {
            xct::Sinogram sinogram = xg::forward_project(geometry, volume, projector);
            ::benchmark::DoNotOptimize(sinogram.span().data());
        }
    }
}

BENCHMARK(bench000_forward_project)->Arg(1)->Arg(4)->Unit(benchmark::kMillisecond);
BENCHMARK(bench001_backward_project)->Arg(1)->Arg(4)->Unit(benchmark::kMillisecond);
BENCHMARK(bench002_forward_project_isotropic)->Unit(benchmark::kMillisecond);
