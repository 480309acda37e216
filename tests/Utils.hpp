#pragma once

#include <algorithm>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <numeric>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

#include <xct/core/Traits.hpp>
#include <xct/core/utils/Strings.hpp>
#include <xct/projector/Projector.hpp>

namespace test {
    extern std::filesystem::path XCT_ASSETS_PATH; // defined at runtime by main.

    using namespace ::xct::types;

    /// Error thrown by FakeProjector::run() on request.
    class ProjectorFailure : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /// Projector recording every call, with a trivial deterministic projection model:
    ///  - forward: projection(p, k) = sum(volume) + 100 * p + angles[k], for pixel p and angle k.
    ///  - backward: every voxel is set to sum(projection) + angles[0].
    class FakeProjector final : public xct::Projector {
    public:
        struct Run {
            xct::Algorithm algorithm;
            std::vector<i64> detector_shape;
            std::vector<f64> detector_spacing;
            std::vector<f64> angles;
        };

        /// If set, run() throws a ProjectorFailure for the projections with an angle satisfying this predicate.
        std::function<bool(f64)> fail_on_angle{};

    public:
        explicit FakeProjector(bool thread_safe = false) : m_thread_safe(thread_safe) {}

        auto allocate_volume(
            const xct::VolumeGeometry& geometry,
            std::span<const f32> values
        ) -> xct::DataId override {
            return allocate_(static_cast<usize>(geometry.n_elements()), values, {});
        }

        auto allocate_projection(
            const xct::ProjectionGeometry& geometry,
            std::span<const f32> values
        ) -> xct::DataId override {
            return allocate_(static_cast<usize>(geometry.n_elements()), values, geometry);
        }

        void run(xct::Algorithm algorithm, xct::DataId volume, xct::DataId projection) override {
            xct::ProjectionGeometry geometry;
            {
                const std::scoped_lock lock(m_mutex);
                geometry = m_objects.at(projection).geometry;
                m_runs.push_back({algorithm, geometry.detector_shape, geometry.detector_spacing, geometry.angles});
                m_threads.insert(std::this_thread::get_id());
            }

            if (fail_on_angle) {
                for (f64 angle: geometry.angles)
                    if (fail_on_angle(angle))
                        throw ProjectorFailure(fmt::format("failed to project angle={}", angle));
            }

            const std::scoped_lock lock(m_mutex);
            std::vector<f32>& volume_values = m_objects.at(volume).values;
            std::vector<f32>& projection_values = m_objects.at(projection).values;
            if (algorithm.is_forward()) {
                const f32 sum = std::accumulate(volume_values.begin(), volume_values.end(), f32{0});
                const usize n_angles = geometry.angles.size();
                for (usize i{}; i < projection_values.size(); ++i) {
                    const usize pixel = i / n_angles;
                    const usize angle = i % n_angles;
                    projection_values[i] = sum + 100 * static_cast<f32>(pixel) +
                                           static_cast<f32>(geometry.angles[angle]);
                }
            } else {
                const f32 sum = std::accumulate(projection_values.begin(), projection_values.end(), f32{0});
                std::fill(volume_values.begin(), volume_values.end(),
                          sum + static_cast<f32>(geometry.angles.at(0)));
            }
        }

        void read(xct::DataId id, std::span<f32> output) override {
            const std::scoped_lock lock(m_mutex);
            const std::vector<f32>& values = m_objects.at(id).values;
            if (output.size() != values.size())
                throw std::length_error("read: output size mismatch");
            std::copy(values.begin(), values.end(), output.begin());
        }

        void release(xct::DataId id) noexcept override {
            const std::scoped_lock lock(m_mutex);
            m_objects.erase(id);
            ++m_n_released;
        }

        [[nodiscard]] auto is_thread_safe() const noexcept -> bool override { return m_thread_safe; }

    public:
        [[nodiscard]] auto runs() const -> std::vector<Run> {
            const std::scoped_lock lock(m_mutex);
            return m_runs;
        }

        [[nodiscard]] auto n_runs() const -> i64 {
            const std::scoped_lock lock(m_mutex);
            return static_cast<i64>(m_runs.size());
        }

        [[nodiscard]] auto n_allocated() const -> i64 {
            const std::scoped_lock lock(m_mutex);
            return m_n_allocated;
        }

        [[nodiscard]] auto n_released() const -> i64 {
            const std::scoped_lock lock(m_mutex);
            return m_n_released;
        }

        /// Number of distinct threads that called run().
        [[nodiscard]] auto n_threads_used() const -> i64 {
            const std::scoped_lock lock(m_mutex);
            return static_cast<i64>(m_threads.size());
        }

        /// Number of objects currently allocated.
        [[nodiscard]] auto n_alive() const -> i64 {
            const std::scoped_lock lock(m_mutex);
            return static_cast<i64>(m_objects.size());
        }

    private:
        struct Object {
            std::vector<f32> values;
            xct::ProjectionGeometry geometry;
        };

        auto allocate_(usize size, std::span<const f32> values, xct::ProjectionGeometry geometry) -> xct::DataId {
            const std::scoped_lock lock(m_mutex);
            Object object{std::vector<f32>(size, f32{0}), std::move(geometry)};
            if (not values.empty())
                std::copy(values.begin(), values.end(), object.values.begin());
            const xct::DataId id = m_next_id++;
            m_objects.emplace(id, std::move(object));
            ++m_n_allocated;
            return id;
        }

    private:
        mutable std::mutex m_mutex;
        std::map<xct::DataId, Object> m_objects;
        std::vector<Run> m_runs;
        std::set<std::thread::id> m_threads;
        xct::DataId m_next_id{1};
        i64 m_n_allocated{};
        i64 m_n_released{};
        bool m_thread_safe;
    };
}
