#include <cmath>

#include "xct/core/types/Grid.hpp"

namespace xct::inline types {
    Grid::Grid(std::vector<i64> shape, std::vector<f64> spacing) :
        m_shape(std::move(shape)),
        m_spacing(std::move(spacing))
    {
        check<ValueError>(not m_shape.empty() and ndim() <= MAX_NDIM,
                          "Grids should have 1 to {} dimensions, but got shape={}", MAX_NDIM, m_shape);
        check<ValueError>(m_shape.size() == m_spacing.size(),
                          "The shape and spacing should have the same number of dimensions, "
                          "but got shape={} and spacing={}", m_shape, m_spacing);
        for (usize i{}; i < m_shape.size(); ++i) {
            check<ValueError>(m_shape[i] >= 0,
                              "The dimension sizes should be nonnegative, but got shape={}", m_shape);
            check<ValueError>(std::isfinite(m_spacing[i]) and m_spacing[i] > 0,
                              "The spacing should be positive finite numbers, but got spacing={}", m_spacing);
        }
    }

    auto Grid::n_elements() const noexcept -> i64 {
        if (m_shape.empty())
            return 0;
        i64 count{1};
        for (i64 size: m_shape)
            count *= size;
        return count;
    }

    auto Grid::strides() const -> std::vector<i64> {
        std::vector<i64> strides(m_shape.size());
        i64 stride{1};
        for (usize i = m_shape.size(); i-- > 0;) {
            strides[i] = stride;
            stride *= m_shape[i];
        }
        return strides;
    }

    auto Grid::extent() const -> std::vector<f64> {
        std::vector<f64> extent(m_shape.size());
        for (usize i{}; i < m_shape.size(); ++i)
            extent[i] = static_cast<f64>(m_shape[i]) * m_spacing[i];
        return extent;
    }

    std::ostream& operator<<(std::ostream& os, const Grid& grid) {
        return os << fmt::format("Grid{{shape={}, spacing={}}}", grid.shape(), grid.spacing());
    }
}
