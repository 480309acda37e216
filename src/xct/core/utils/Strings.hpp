#pragma once

#include "xct/core/Config.hpp"
#include "xct/core/Traits.hpp"

// Suppress fmt warnings...
#if defined(XCT_COMPILER_GCC) || defined(XCT_COMPILER_CLANG)
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Wsign-conversion"
#   pragma GCC diagnostic ignored "-Wshadow"
#   pragma GCC diagnostic ignored "-Wformat-nonliteral"
#   pragma GCC diagnostic ignored "-Wtautological-compare"
#   if defined(XCT_COMPILER_GCC)
#       pragma GCC diagnostic ignored "-Wstringop-overflow"
#   endif
#elif defined(XCT_COMPILER_MSVC)
#   pragma warning(push, 0)
#endif

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <fmt/ranges.h>

#if defined(XCT_COMPILER_GCC) || defined(XCT_COMPILER_CLANG)
#   pragma GCC diagnostic pop
#elif defined(XCT_COMPILER_MSVC)
#   pragma warning(pop)
#endif

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace xct {
    // Left trims str.
    [[nodiscard]] inline std::string_view trim_left(std::string_view str) {
        auto is_not_space = [](int ch) { return !std::isspace(ch); };
        const char* start = std::find_if(str.begin(), str.end(), is_not_space);
        return std::string_view{start, static_cast<usize>(str.end() - start)};
    }

    // Right trims str.
    [[nodiscard]] inline std::string_view trim_right(std::string_view str) {
        auto is_not_space = [](int ch) { return !std::isspace(ch); };
        const char* end = std::find_if(str.rbegin(), str.rend(), is_not_space).base();
        return std::string_view{str.begin(), static_cast<usize>(end - str.begin())};
    }

    // Trims (left and right) str.
    [[nodiscard]] inline std::string_view trim(std::string_view str) {
        return trim_left(trim_right(str));
    }

    // Returns the lowercase version of str.
    // Undefined behavior if the characters are neither representable as unsigned char nor equal to EOF.
    [[nodiscard]] inline std::string to_lower(std::string_view str) {
        std::string out(str);
        std::transform(str.begin(), str.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
        return out;
    }

    /// Parses a string into a T.
    /// \tparam T   integer: similar to from_chars (+ plus-sign support) with base=10.
    ///             std::string: remove trailing whitespaces and convert to lowercase.
    template<typename T>
    auto parse(std::string_view string) noexcept -> std::optional<T> {
        if constexpr (nt::integer<T>) {
            string = trim(string);
            T output{};
            const bool has_plus = string.size() > 1 and string[0] == '+';
            const char* first = string.data() + has_plus;
            const char* last = string.data() + string.size();
            const auto [ptr, ec] = std::from_chars(first, last, output);
            if (ec == std::errc{} and ptr == last)
                return output;
            return std::nullopt;

        } else if constexpr (std::is_same_v<T, std::string>) {
            return to_lower(trim(string));

        } else {
            static_assert(nt::always_false<T>);
        }
    }
}
