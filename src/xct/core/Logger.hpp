#pragma once

#include "xct/core/Config.hpp"
#include "xct/core/Traits.hpp"

#if defined(XCT_COMPILER_GCC) || defined(XCT_COMPILER_CLANG)
    #pragma GCC diagnostic push
    #pragma GCC diagnostic ignored "-Wsign-conversion"
    #pragma GCC diagnostic ignored "-Wshadow"
    #pragma GCC diagnostic ignored "-Wformat-nonliteral"
#elif defined(XCT_COMPILER_MSVC)
    #pragma warning(push, 0)
#endif

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#if defined(XCT_COMPILER_GCC) || defined(XCT_COMPILER_CLANG)
    #pragma GCC diagnostic pop
#elif defined(XCT_COMPILER_MSVC)
    #pragma warning(pop)
#endif

#include <string>
#include <string_view>
#include <memory>
#include <vector>

namespace xct {
    /// By default, Logger contains two thread safe sinks, one controls the console, the other controls the log file.
    /// \details Sinks have specific settings, such as log formatting and log level, and can be shared with
    ///          other loggers. Loggers are not registered to the spdlog registry. Functions of the library log
    ///          through the static xct::Session::logger.
    /// \note An empty logger (default constructed) discards every message.
    class Logger {
    public:
        /// Log levels:
        ///   - \a VERBOSE: activates the error, warn, info, debug and trace levels.
        ///   - \a BASIC:   activates the error, warn and info levels.
        ///   - \a ALERT:   activates the error and warn levels.
        ///   - \a SILENT:  deactivates all logging.
        enum Level : u32 { SILENT, ALERT, BASIC, VERBOSE };

    public: // static functions
        /// Creates a logger connected to existing sinks.
        /// \param name      Name of the logger.
        /// \param sinks     Sinks to link to the logger
        /// \return          The owning pointer of the created logger, which also owns the \a sinks.
        static auto create(
            std::string_view name,
            const std::vector<spdlog::sink_ptr>& sinks
        ) -> std::shared_ptr<spdlog::logger>;

        /// Creates a logger with a thread-safe console sink and, optionally, a thread-safe basic file sink.
        /// \param name         Name of the logger. The file sink prefixes all entry with this name.
        /// \param filename     Filename used by the file sink. If empty, the file sink is not created.
        ///                     If the file exists, logging messages will be appended.
        /// \param verbosity    Level of verbosity of the console sink. The file sink is set to Level::VERBOSE.
        /// \returns            The owning pointer of the created logger, which also owns the created sink(s).
        /// \note The console sink is the first sink. The file sink, if any, comes next.
        static auto create(
            std::string_view name,
            std::string_view filename,
            Level verbosity_console
        ) -> std::shared_ptr<spdlog::logger>;

        /// Sets the level of \a verbosity of a \a sink.
        static void set_level(spdlog::sink_ptr& sink, Level verbosity);

    public:
        /// Creates an empty instance.
        Logger() = default;

        /// Creates a new logger. \see Logger::create for more details.
        Logger(std::string_view name, std::string_view filename, Level verbosity)
                : m_logger(create(name, filename, verbosity)) {}

        /// Creates a new logger using existing sinks. \see Logger::create for more details.
        Logger(std::string_view name, const std::vector<spdlog::sink_ptr>& sinks)
                : m_logger(create(name, sinks)) {}

        /// Whether the logger is connected to an underlying spdlog logger.
        [[nodiscard]] auto is_empty() const noexcept -> bool { return m_logger == nullptr; }

        /// Returns a reference of the underlying \a spdlog logger.
        [[nodiscard]] auto get() -> std::shared_ptr<spdlog::logger>& { return m_logger; }

        /// Sets the verbosity of the console sink, i.e. the first sink.
        void set_console_level(Level verbosity) {
            if (m_logger and not m_logger->sinks().empty())
                set_level(m_logger->sinks()[0], verbosity);
        }

        template<typename... Args>
        void trace(fmt::format_string<Args...> fmt, Args&&... args) {
            if (m_logger)
                m_logger->trace(fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void info(fmt::format_string<Args...> fmt, Args&&... args) {
            if (m_logger)
                m_logger->info(fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void warn(fmt::format_string<Args...> fmt, Args&&... args) {
            if (m_logger)
                m_logger->warn(fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void error(fmt::format_string<Args...> fmt, Args&&... args) {
            if (m_logger)
                m_logger->error(fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void debug([[maybe_unused]] fmt::format_string<Args...> fmt, [[maybe_unused]] Args&&... args) {
        #ifdef XCT_DEBUG
            if (m_logger)
                m_logger->debug(fmt, std::forward<Args>(args)...);
        #endif
        }

        /// Whether a message at the trace level would be emitted by at least one sink.
        [[nodiscard]] auto should_trace() const -> bool {
            if (not m_logger)
                return false;
            for (const auto& sink: m_logger->sinks())
                if (sink->should_log(spdlog::level::trace))
                    return true;
            return false;
        }

    private:
        std::shared_ptr<spdlog::logger> m_logger;
    };
}
