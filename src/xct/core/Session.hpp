#pragma once

#include <atomic>
#include <string>
#include <string_view>

#include "xct/Version.hpp"
#include "xct/core/Logger.hpp"

namespace xct {
    /// Global session. There should only be one session at a given time.
    /// Without a session, the library doesn't log anything and the number of threads is deduced
    /// the first time it is requested.
    class Session {
    public:
        /// Creates a new session.
        /// \param name         Name of the session.
        /// \param filename     Filename of the sessions log file.
        ///                     If it is an empty string, the logger only logs in the console.
        /// \param verbosity    Verbosity of the console. The log file, if any, is always set to the maximum verbosity.
        /// \param threads      The maximum number of internal threads used during a session.
        ///                     If 0, retrieve value from environmental variable XCT_THREADS or OMP_NUM_THREADS.
        ///                     If these variables are empty or not defined, try to deduce the number of available
        ///                     threads and use this number instead.
        /// \note The logger is always accessible, and its settings and its sinks can be replaced at any time.
        Session(
            std::string_view name,
            std::string_view filename,
            Logger::Level verbosity = Logger::BASIC,
            i64 threads = 0
        ) {
            logger = Logger(name, filename, verbosity);
            set_thread_limit(threads);
        }

        /// Sets the maximum number of internal threads used by a session.
        /// \param n_threads    Maximum number of threads.
        ///                     If 0, retrieve value from environmental variable XCT_THREADS or OMP_NUM_THREADS.
        ///                     If these variables are empty or not defined, try to deduce the number of available
        ///                     threads and use this number instead.
        static void set_thread_limit(i64 n_threads);

        /// Returns the maximum number of internal threads.
        /// If it was never set, it is deduced as if set_thread_limit(0) was called. Thread-safe.
        [[nodiscard]] static auto thread_limit() -> i64 {
            if (m_thread_limit.load() <= 0)
                set_thread_limit(0);
            return m_thread_limit.load();
        }

    public:
        static auto version() -> std::string { return XCT_VERSION_STRING; }
        static auto url() -> std::string { return XCT_URL; }

    public:
        /// Logger used by all functions in the library.
        static Logger logger;

    private:
        static std::atomic<i64> m_thread_limit;
    };
}
