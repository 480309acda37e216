#pragma once

#include <exception>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

#include "xct/core/Config.hpp"
#include "xct/core/utils/Strings.hpp"

namespace xct {
    /// Exception type used in xct.
    class Exception : public std::exception {
    public:
        /// Returns the message of all the nested exceptions, from the newest to the oldest exception.
        /// \details This gets the current exception and gets its message using what(). Then, if the exception is
        ///          a std::nested_exception, i.e. it was thrown using std::throw_with_nested, it gets the nested
        ///          exceptions' messages until it reaches the last exception. These exceptions should inherit from
        ///          std::exception, otherwise we have no safe way to retrieve its message, and a generic message is
        ///          returned instead saying that an unknown exception was thrown and the backtrace stops.
        /// \example
        /// \code
        /// const std::vector<std::string> backtrace_vector = xct::Exception::backtrace();
        /// std::string backtrace_message;
        /// for (i64 i{}; auto& message: backtrace_vector)
        ///     backtrace_message += fmt::format("[{}]: {}\n", i++, message);
        /// \endcode
        [[nodiscard]] static auto backtrace() noexcept -> std::vector<std::string> {
            std::vector<std::string> message;
            backtrace_(message);
            return message;
        }

    public:
        /// Format the error message, which is then accessible with what().
        /// \param[in] file      File name.
        /// \param[in] function  Function name.
        /// \param[in] line      Line number.
        /// \param[in] message   Error message.
        Exception(const char* file, const char* function, std::uint_least32_t line, std::string_view message) :
            m_buffer(format_(file, function, line, message)) {}

        /// Returns the formatted error message of this exception.
        [[nodiscard]] auto what() const noexcept -> const char* override {
            return m_buffer.data();
        }

    protected:
        static auto format_(
            const char* file,
            const char* function,
            std::uint_least32_t line,
            std::string_view message
        ) -> std::string;

        static void backtrace_(
            std::vector<std::string>& message,
            const std::exception_ptr& exception_ptr = std::current_exception()
        );

    protected:
        std::string m_buffer{};
    };

    /// A scale factor is not a positive finite number.
    class DomainError : public Exception {
    public:
        using Exception::Exception;
    };

    /// Malformed input, e.g. a grid with the wrong dimensionality or an array of the wrong size.
    class ValueError : public Exception {
    public:
        using Exception::Exception;
    };

    /// The backend name is not recognized.
    class UnsupportedBackendError : public Exception {
    public:
        using Exception::Exception;
    };

    /// The requested combination of backend and dimensionality is not implemented.
    class NotImplementedError : public Exception {
    public:
        using Exception::Exception;
    };

    namespace guts {
        template<typename... Ts>
        struct FormatWithLocation {
            using runtime_format_type = decltype(fmt::runtime(std::string_view{}));

            fmt::format_string<Ts...> fmt;
            std::source_location location;

            template<typename T>
            consteval /*implicit*/ FormatWithLocation(
                const T& s,
                const std::source_location& l = std::source_location::current()
            ) : fmt(s), location(l) {} // fmt checks at compile time that "s" is compatible with "Ts"

            /*implicit*/ FormatWithLocation(
                const runtime_format_type& s,
                const std::source_location& l = std::source_location::current()
            ) : fmt(s), location(l) {} // no checks
        };
    }

    /// Throws an exception of type E with an error message and a specific, i.e. non-defaulted, source location.
    /// The format string is checked at compile time by default, except if fmt::runtime is used.
    template<std::derived_from<Exception> E = Exception, typename... Ts>
    [[noreturn]] void panic_at_location(
        const std::source_location& location,
        fmt::format_string<Ts...> fmt,
        Ts&&... args
    ) {
        std::throw_with_nested(
                E(location.file_name(), location.function_name(), location.line(),
                  fmt::format(fmt, std::forward<Ts>(args)...))
        );
    }

    /// Throws an exception with an error message already formatted.
    template<std::derived_from<Exception> E = Exception>
    [[noreturn]] void panic_runtime(
        std::string_view message,
        const std::source_location& location = std::source_location::current()
    ) {
        panic_at_location<E>(location, fmt::runtime(message));
    }

    /// Throws an exception of type E with an error message and the current source location.
    template<std::derived_from<Exception> E = Exception, typename... Ts>
    [[noreturn]] void panic(guts::FormatWithLocation<std::type_identity_t<Ts>...> fmt, Ts&&... args) {
        panic_at_location<E>(fmt.location, fmt.fmt, std::forward<Ts>(args)...);
    }

    /// Throws an exception of type E if the expression evaluates to false.
    template<std::derived_from<Exception> E = Exception, typename... Ts>
    void check(bool expression, guts::FormatWithLocation<std::type_identity_t<Ts>...> fmt, Ts&&... args) {
        if (expression) {
            return;
        } else {
            panic_at_location<E>(fmt.location, fmt.fmt, std::forward<Ts>(args)...);
        }
    }
}
