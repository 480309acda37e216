#pragma once

#include <span>
#include <vector>

#include "xct/core/Error.hpp"
#include "xct/core/Traits.hpp"
#include "xct/core/types/Grid.hpp"

namespace xct::inline types {
    /// Dense function sampled on a Grid, e.g. a volume or a sinogram.
    /// \details The field owns its values, stored contiguously in the row-major order of the grid.
    class Field {
    public:
        using value_type = f32;

    public:
        /// Creates an empty field.
        Field() = default;

        /// Creates a zero-initialized field.
        explicit Field(Grid grid) :
            m_grid(std::move(grid)),
            m_values(static_cast<usize>(m_grid.n_elements()), value_type{}) {}

        /// Creates a field from existing values.
        /// \throws ValueError if the number of values doesn't match the number of samples of the grid.
        Field(Grid grid, std::vector<value_type> values) :
            m_grid(std::move(grid)),
            m_values(std::move(values))
        {
            check<ValueError>(static_cast<i64>(m_values.size()) == m_grid.n_elements(),
                              "The number of values ({}) doesn't match the grid {}", m_values.size(), m_grid);
        }

    public:
        [[nodiscard]] auto grid() const noexcept -> const Grid& { return m_grid; }
        [[nodiscard]] auto shape() const noexcept -> const std::vector<i64>& { return m_grid.shape(); }
        [[nodiscard]] auto spacing() const noexcept -> const std::vector<f64>& { return m_grid.spacing(); }
        [[nodiscard]] auto ndim() const noexcept -> i64 { return m_grid.ndim(); }
        [[nodiscard]] auto n_elements() const noexcept -> i64 { return static_cast<i64>(m_values.size()); }
        [[nodiscard]] auto is_empty() const noexcept -> bool { return m_values.empty(); }

        [[nodiscard]] auto data() noexcept -> value_type* { return m_values.data(); }
        [[nodiscard]] auto data() const noexcept -> const value_type* { return m_values.data(); }
        [[nodiscard]] auto span() noexcept -> std::span<value_type> { return m_values; }
        [[nodiscard]] auto span() const noexcept -> std::span<const value_type> { return m_values; }

        /// Releases the values. The field is left empty.
        [[nodiscard]] auto release() noexcept -> std::vector<value_type> {
            std::vector<value_type> values = std::move(m_values);
            m_values.clear();
            m_grid = Grid{};
            return values;
        }

    public: // Element access of 2d and 3d fields.
        [[nodiscard]] auto operator()(i64 i, i64 j) -> value_type& { return m_values[offset_(i, j)]; }
        [[nodiscard]] auto operator()(i64 i, i64 j) const -> const value_type& { return m_values[offset_(i, j)]; }
        [[nodiscard]] auto operator()(i64 i, i64 j, i64 k) -> value_type& { return m_values[offset_(i, j, k)]; }
        [[nodiscard]] auto operator()(i64 i, i64 j, i64 k) const -> const value_type& {
            return m_values[offset_(i, j, k)];
        }

    private:
        [[nodiscard]] auto offset_(i64 i, i64 j) const noexcept -> usize {
            XCT_ASSERT(ndim() == 2 and i >= 0 and i < shape()[0] and j >= 0 and j < shape()[1]);
            return static_cast<usize>(i * shape()[1] + j);
        }

        [[nodiscard]] auto offset_(i64 i, i64 j, i64 k) const noexcept -> usize {
            XCT_ASSERT(ndim() == 3 and i >= 0 and i < shape()[0] and
                       j >= 0 and j < shape()[1] and k >= 0 and k < shape()[2]);
            return static_cast<usize>((i * shape()[1] + j) * shape()[2] + k);
        }

    private:
        Grid m_grid{};
        std::vector<value_type> m_values{};
    };

    /// Stack of projections indexed by (detector dimensions..., angle).
    using Sinogram = Field;

    /// Volume indexed by (x, y[, z]).
    using VolumeField = Field;
}
