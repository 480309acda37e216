#pragma once

#include <ostream>
#include <string_view>

#include "xct/core/Config.hpp"
#include "xct/core/Error.hpp"
#include "xct/core/Traits.hpp"
#include "xct/core/utils/Strings.hpp"

namespace xct {
    /// Enum-class-like object encoding the compute backend of the external projector.
    struct Backend {
        enum class Type : i32 {
            /// Host implementation of the projector. Only 2d geometries are supported.
            CPU = 0,

            /// Accelerated implementation of the projector.
            GPU = 1,
        } value{Type::GPU};

    public: // simplify Backend::Type into Backend
        using enum Type;
        constexpr Backend() noexcept = default;
        constexpr /*implicit*/ Backend(Type value_) noexcept : value(value_) {}
        constexpr /*implicit*/ operator Type() const noexcept { return value; }

        /// Creates a backend from its name, i.e. "cpu" or "gpu".
        /// The name is case-insensitive and surrounding whitespaces are ignored.
        /// \throws UnsupportedBackendError if the name is not recognized.
        explicit Backend(std::string_view name);

        /// Creates a backend from a string literal.
        /* implicit */ Backend(const char* name) : Backend(std::string_view(name)) {}

    public:
        [[nodiscard]] constexpr auto is_cpu() const noexcept -> bool { return value == CPU; }
        [[nodiscard]] constexpr auto is_gpu() const noexcept -> bool { return value == GPU; }
    };

    /// Quadrant of a direction of the rotation plane, from the signs of its (x, y) components.
    /// Zero components are treated as nonnegative.
    enum class Quadrant : i32 {
        FIRST = 1,  // (+,+)
        SECOND = 2, // (-,+)
        THIRD = 3,  // (-,-)
        FOURTH = 4, // (+,-)
    };

    /// Inverse trigonometric function used to recover an angle from a unit direction.
    enum class Branch : i32 { ASIN, ACOS };
}

namespace xct {
    std::ostream& operator<<(std::ostream& os, Backend backend);
    std::ostream& operator<<(std::ostream& os, Quadrant quadrant);
    std::ostream& operator<<(std::ostream& os, Branch branch);

    inline std::ostream& operator<<(std::ostream& os, Backend::Type backend) { return os << Backend(backend); }
}

// fmt 9.1.0 fix (Disabled automatic std::ostream insertion operator)
namespace fmt {
    template<> struct formatter<xct::Backend> : ostream_formatter {};
    template<> struct formatter<xct::Backend::Type> : ostream_formatter {};
    template<> struct formatter<xct::Quadrant> : ostream_formatter {};
    template<> struct formatter<xct::Branch> : ostream_formatter {};
}
