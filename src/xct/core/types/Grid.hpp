#pragma once

#include <ostream>
#include <vector>

#include "xct/core/Error.hpp"
#include "xct/core/Traits.hpp"

namespace xct::inline types {
    /// Regular grid metadata: the number of samples and the physical size of one cell along each dimension.
    /// \details Grids have 1 to 3 dimensions. Dimension sizes are nonnegative (a zero-sized dimension describes
    ///          an empty grid, e.g. a sinogram without angles) and spacings are positive finite numbers.
    ///          The samples of a grid are laid out in row-major order, i.e. the last dimension is contiguous.
    class Grid {
    public:
        static constexpr i64 MAX_NDIM = 3;

    public:
        /// Creates an empty 0d grid.
        Grid() = default;

        /// Creates a grid.
        /// \throws ValueError if the shape and spacing don't have the same number (1 to 3) of dimensions,
        ///         if a dimension size is negative, or if a spacing is not a positive finite number.
        Grid(std::vector<i64> shape, std::vector<f64> spacing);

        /// Creates a grid with a unit spacing.
        explicit Grid(std::vector<i64> shape) : Grid(shape, std::vector<f64>(shape.size(), 1.)) {}

    public:
        [[nodiscard]] auto ndim() const noexcept -> i64 { return static_cast<i64>(m_shape.size()); }
        [[nodiscard]] auto shape() const noexcept -> const std::vector<i64>& { return m_shape; }
        [[nodiscard]] auto spacing() const noexcept -> const std::vector<f64>& { return m_spacing; }
        [[nodiscard]] auto shape(i64 dim) const -> i64 { return m_shape.at(static_cast<usize>(dim)); }
        [[nodiscard]] auto spacing(i64 dim) const -> f64 { return m_spacing.at(static_cast<usize>(dim)); }

        /// Number of samples in the grid. 0d grids have no samples.
        [[nodiscard]] auto n_elements() const noexcept -> i64;

        /// Whether the grid has no samples.
        [[nodiscard]] auto is_empty() const noexcept -> bool { return n_elements() == 0; }

        /// Row-major strides, in number of elements.
        [[nodiscard]] auto strides() const -> std::vector<i64>;

        /// Physical extent of the grid along each dimension, i.e. shape * spacing.
        [[nodiscard]] auto extent() const -> std::vector<f64>;

        [[nodiscard]] friend bool operator==(const Grid& lhs, const Grid& rhs) noexcept {
            return lhs.m_shape == rhs.m_shape and lhs.m_spacing == rhs.m_spacing;
        }

    private:
        std::vector<i64> m_shape{};
        std::vector<f64> m_spacing{};
    };

    std::ostream& operator<<(std::ostream& os, const Grid& grid);
}

namespace fmt {
    template<> struct formatter<xct::Grid> : ostream_formatter {};
}
