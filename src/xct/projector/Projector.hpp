#pragma once

#include <ostream>
#include <span>
#include <utility>
#include <vector>

#include "xct/core/Enums.hpp"
#include "xct/core/Error.hpp"
#include "xct/core/Traits.hpp"

namespace xct {
    /// Identifier of a data object owned by a projector.
    using DataId = i64;

    /// Volume geometry, as seen by the projector. Voxels have a unit size on every axis.
    struct VolumeGeometry {
        std::vector<i64> shape; // (x, y[, z])

        [[nodiscard]] auto n_elements() const noexcept -> i64 {
            i64 count{1};
            for (i64 size: shape)
                count *= size;
            return count;
        }
    };

    /// Projection geometry, as seen by the projector.
    /// \details The detector pixel spacing is expressed in voxel units. The projection data is laid out as
    ///          (detector dimensions..., angle), in row-major order.
    struct ProjectionGeometry {
        std::vector<i64> detector_shape;   // 1d or 2d
        std::vector<f64> detector_spacing; // same size as detector_shape
        std::vector<f64> angles;           // radians

        [[nodiscard]] auto n_elements() const noexcept -> i64 {
            i64 count = static_cast<i64>(angles.size());
            for (i64 size: detector_shape)
                count *= size;
            return count;
        }
    };

    /// Enum-class-like object encoding the projection algorithm to run.
    struct Algorithm {
        enum class Method : i32 {
            /// 2d forward and backprojection, on the CPU.
            FP = 0,
            BP = 1,

            /// 2d forward and backprojection, on the GPU.
            FP_CUDA = 10,
            BP_CUDA = 11,

            /// 3d forward and backprojection, on the GPU.
            FP3D_CUDA = 20,
            BP3D_CUDA = 21,
        } value{};

    public: // simplify Algorithm::Method into Algorithm
        using enum Method;
        constexpr Algorithm() noexcept = default;
        constexpr /*implicit*/ Algorithm(Method value_) noexcept : value(value_) {}
        constexpr /*implicit*/ operator Method() const noexcept { return value; }

    public:
        /// Selects the algorithm of a forward or backward projection.
        /// \throws ValueError if \p ndim is not 2 or 3.
        /// \throws NotImplementedError if the backend cannot run this projection, i.e. 3d projections on the CPU.
        [[nodiscard]] static auto select(bool is_forward, Backend backend, i64 ndim) -> Algorithm;

        /// Whether this is a forward projection.
        [[nodiscard]] constexpr auto is_forward() const noexcept -> bool {
            return to_underlying(value) % 2 == 0;
        }
    };

    std::ostream& operator<<(std::ostream& os, Algorithm algorithm);
    inline std::ostream& operator<<(std::ostream& os, Algorithm::Method algorithm) { return os << Algorithm(algorithm); }
}

namespace fmt {
    template<> struct formatter<xct::Algorithm> : ostream_formatter {};
    template<> struct formatter<xct::Algorithm::Method> : ostream_formatter {};
}

namespace xct {
    /// Capability interface of an external projector.
    /// \details Projectors compute parallel-beam ray projections through grids with unit voxels. They own the data
    ///          objects they allocate, and these objects are referred to by their DataId until released.
    ///          Data is exchanged in the row-major layout of VolumeGeometry and ProjectionGeometry. Projectors
    ///          wrapping a library with a different axis convention are responsible for reordering the axes.
    /// \note The library never calls release() twice with the same id, and every allocated object is released,
    ///       whether the operation succeeds or not. Prefer ProjectorData to manage these objects.
    class Projector {
    public:
        virtual ~Projector() = default;

        /// Allocates a volume. If \p values is empty, the volume is zero-initialized.
        /// Otherwise, \p values should have as many elements as the volume.
        [[nodiscard]] virtual auto allocate_volume(
            const VolumeGeometry& geometry,
            std::span<const f32> values
        ) -> DataId = 0;

        /// Allocates the projections. If \p values is empty, the projections are zero-initialized.
        /// Otherwise, \p values should have as many elements as the projections.
        [[nodiscard]] virtual auto allocate_projection(
            const ProjectionGeometry& geometry,
            std::span<const f32> values
        ) -> DataId = 0;

        /// Runs the algorithm. Forward projections read the volume and write the projections.
        /// Backprojections read the projections and write the volume.
        virtual void run(Algorithm algorithm, DataId volume, DataId projection) = 0;

        /// Copies the values of a data object to \p output, which should have as many elements as the object.
        virtual void read(DataId id, std::span<f32> output) = 0;

        /// Releases a data object.
        virtual void release(DataId id) noexcept = 0;

        /// Whether the member functions can be called concurrently from multiple threads.
        [[nodiscard]] virtual auto is_thread_safe() const noexcept -> bool { return false; }
    };

    /// Owning handle to a data object of a projector. Releases the object when destructed.
    class ProjectorData {
    public:
        ProjectorData() = default;
        ProjectorData(Projector& projector, DataId id) noexcept : m_projector(&projector), m_id(id) {}

        ProjectorData(const ProjectorData&) = delete;
        ProjectorData& operator=(const ProjectorData&) = delete;

        ProjectorData(ProjectorData&& other) noexcept :
            m_projector(std::exchange(other.m_projector, nullptr)),
            m_id(other.m_id) {}

        ProjectorData& operator=(ProjectorData&& other) noexcept {
            if (this != &other) {
                reset();
                m_projector = std::exchange(other.m_projector, nullptr);
                m_id = other.m_id;
            }
            return *this;
        }

        ~ProjectorData() { reset(); }

    public:
        [[nodiscard]] auto id() const noexcept -> DataId { return m_id; }
        [[nodiscard]] auto is_empty() const noexcept -> bool { return m_projector == nullptr; }

        /// Releases the data object, if any.
        void reset() noexcept {
            if (m_projector)
                std::exchange(m_projector, nullptr)->release(m_id);
        }

    private:
        Projector* m_projector{};
        DataId m_id{};
    };

    /// Allocates a volume managed by the returned handle.
    /// \throws ValueError if \p values is not empty and doesn't match the geometry.
    [[nodiscard]] auto allocate_volume(
        Projector& projector,
        const VolumeGeometry& geometry,
        std::span<const f32> values = {}
    ) -> ProjectorData;

    /// Allocates projections managed by the returned handle.
    /// \throws ValueError if \p values is not empty and doesn't match the geometry.
    [[nodiscard]] auto allocate_projection(
        Projector& projector,
        const ProjectionGeometry& geometry,
        std::span<const f32> values = {}
    ) -> ProjectorData;

    /// Forward projects an allocated volume.
    /// The projections are allocated, computed, read back and released before returning.
    /// \param projector            Projector owning the volume.
    /// \param algorithm            Forward projection algorithm.
    /// \param volume               Volume to project.
    /// \param projection_geometry  Detector and angle(s) of the projections.
    /// \return The projections, laid out as (detector dimensions..., angle).
    [[nodiscard]] auto project_single(
        Projector& projector,
        Algorithm algorithm,
        const ProjectorData& volume,
        const ProjectionGeometry& projection_geometry
    ) -> std::vector<f32>;

    /// Forward projects a volume. The volume is uploaded to the projector and released before returning.
    /// \throws ValueError if \p volume doesn't match \p volume_geometry.
    [[nodiscard]] auto project_single(
        Projector& projector,
        Algorithm algorithm,
        std::span<const f32> volume,
        const VolumeGeometry& volume_geometry,
        const ProjectionGeometry& projection_geometry
    ) -> std::vector<f32>;

    /// Backprojects projections into a volume.
    /// The projections and the volume are allocated, computed, read back and released before returning.
    /// \param projector            Projector.
    /// \param algorithm            Backprojection algorithm.
    /// \param projection           Projections to backproject, laid out as (detector dimensions..., angle).
    /// \param projection_geometry  Detector and angle(s) of the projections.
    /// \param volume_geometry      Geometry of the output volume.
    /// \return The backprojected volume.
    [[nodiscard]] auto backproject_single(
        Projector& projector,
        Algorithm algorithm,
        std::span<const f32> projection,
        const ProjectionGeometry& projection_geometry,
        const VolumeGeometry& volume_geometry
    ) -> std::vector<f32>;
}
