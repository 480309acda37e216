#pragma once

#include <climits>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <concepts>
#include <utility>

#include "xct/core/Config.hpp"

// Assume POSIX, which guarantees CHAR_BIT == 8.
static_assert(CHAR_BIT == 8);
static_assert(sizeof(float) == 4);
static_assert(sizeof(double) == 8);

namespace xct::inline types {
    using u8 = uint8_t;
    using u32 = uint32_t;
    using u64 = uint64_t;

    using i32 = int32_t;
    using i64 = int64_t;
    using usize = size_t;

    using f32 = float;
    using f64 = double;
}

namespace xct::traits {
    template<typename T = void> concept always_false = false;

    template<typename T, typename... U> concept same_as = (std::is_same_v<T, U> and ...);
    template<typename T, typename... U> concept any_of = (same_as<T, U> or ...); // "fold or" defaults to false

    template<typename T> concept integer = std::is_integral_v<std::remove_cv_t<T>> and
                                           not std::is_same_v<std::remove_cv_t<T>, bool>;
    template<typename T> concept real = std::is_floating_point_v<std::remove_cv_t<T>>;
    template<typename T> concept scalar = integer<T> or real<T>;

    template<typename From, typename To>
    concept static_castable_to = requires (From v) { static_cast<To>(v); };
}

namespace xct {
    namespace nt = ::xct::traits;

    /// Casts an enum to its underlying type.
    template<typename Enum> requires std::is_enum_v<Enum>
    [[nodiscard]] constexpr auto to_underlying(Enum value) noexcept {
        return static_cast<std::underlying_type_t<Enum>>(value);
    }
}
