#pragma once

#include <cmath>
#include <ostream>

#include "xct/core/Config.hpp"
#include "xct/core/Traits.hpp"
#include "xct/core/utils/Strings.hpp"

namespace xct::inline types {
    /// Aggregates of N values with the same type.
    /// \tparam T Numeric type.
    /// \tparam N Size of the vector.
    template<nt::scalar T, usize N> requires (N > 0)
    class Vec {
    public:
        using value_type = T;
        static constexpr i64 SSIZE = N;
        static constexpr usize SIZE = N;

    public:
        T array[N];

    public: // Static factory functions
        template<nt::static_castable_to<value_type> U>
        [[nodiscard]] static constexpr Vec from_value(const U& value) noexcept {
            Vec vec{};
            const auto value_cast = static_cast<value_type>(value);
            for (usize i{}; i < SIZE; ++i)
                vec[i] = value_cast;
            return vec;
        }

        template<nt::static_castable_to<value_type>... U> requires (sizeof...(U) == SIZE)
        [[nodiscard]] static constexpr Vec from_values(const U&... values) noexcept {
            return {static_cast<value_type>(values)...};
        }

    public: // Accessor operators and functions
        template<nt::integer I>
        [[nodiscard]] constexpr value_type& operator[](I i) noexcept {
            XCT_ASSERT(static_cast<i64>(i) >= 0 and static_cast<i64>(i) < SSIZE);
            return array[i];
        }

        template<nt::integer I>
        [[nodiscard]] constexpr const value_type& operator[](I i) const noexcept {
            XCT_ASSERT(static_cast<i64>(i) >= 0 and static_cast<i64>(i) < SSIZE);
            return array[i];
        }

        [[nodiscard]] constexpr const value_type* data() const noexcept { return array; }
        [[nodiscard]] constexpr value_type* data() noexcept { return array; }
        [[nodiscard]] static constexpr usize size() noexcept { return SIZE; };

    public: // Iterators -- support for range loops
        [[nodiscard]] constexpr value_type* begin() noexcept { return data(); }
        [[nodiscard]] constexpr const value_type* begin() const noexcept { return data(); }
        [[nodiscard]] constexpr value_type* end() noexcept { return data() + SSIZE; }
        [[nodiscard]] constexpr const value_type* end() const noexcept { return data() + SSIZE; }

    public: // Arithmetic operators
        #define XCT_VEC_ARITH_(op)                                                                  \
        [[nodiscard]] friend constexpr Vec operator op(const Vec& lhs, const Vec& rhs) noexcept {   \
            Vec out{};                                                                                \
            for (usize i{}; i < SIZE; ++i)                                                          \
                out[i] = lhs[i] op rhs[i];                                                          \
            return out;                                                                             \
        }                                                                                           \
        [[nodiscard]] friend constexpr Vec operator op(const Vec& lhs, const value_type& rhs) noexcept { \
            Vec out{};                                                                                \
            for (usize i{}; i < SIZE; ++i)                                                          \
                out[i] = lhs[i] op rhs;                                                             \
            return out;                                                                             \
        }                                                                                           \
        constexpr Vec& operator op##=(const Vec& vector) noexcept {                                 \
            *this = *this op vector;                                                                \
            return *this;                                                                           \
        }                                                                                           \
        constexpr Vec& operator op##=(const value_type& value) noexcept {                           \
            *this = *this op value;                                                                 \
            return *this;                                                                           \
        }
        XCT_VEC_ARITH_(+)
        XCT_VEC_ARITH_(-)
        XCT_VEC_ARITH_(*)
        XCT_VEC_ARITH_(/)
        #undef XCT_VEC_ARITH_

        [[nodiscard]] friend constexpr Vec operator-(const Vec& vector) noexcept {
            Vec out{};
            for (usize i{}; i < SIZE; ++i)
                out[i] = -vector[i];
            return out;
        }

        [[nodiscard]] friend constexpr bool operator==(const Vec& lhs, const Vec& rhs) noexcept {
            for (usize i{}; i < SIZE; ++i)
                if (lhs[i] != rhs[i])
                    return false;
            return true;
        }
    };

    template<typename T> using Vec2 = Vec<T, 2>;
    template<typename T> using Vec3 = Vec<T, 3>;
}

namespace xct {
    template<typename T, usize N>
    [[nodiscard]] constexpr auto dot(const Vec<T, N>& lhs, const Vec<T, N>& rhs) noexcept -> T {
        T out{};
        for (usize i{}; i < N; ++i)
            out += lhs[i] * rhs[i];
        return out;
    }

    template<nt::real T, usize N>
    [[nodiscard]] auto norm(const Vec<T, N>& vector) noexcept -> T {
        if constexpr (N == 2)
            return std::hypot(vector[0], vector[1]);
        else
            return std::sqrt(dot(vector, vector));
    }

    template<typename T, usize N>
    auto operator<<(std::ostream& os, const Vec<T, N>& vector) -> std::ostream& {
        os << fmt::format("{}", fmt::join(vector.begin(), vector.end(), ", "));
        return os;
    }
}
