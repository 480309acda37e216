#ifdef XCT_ENABLE_OPENMP
#include <omp.h>
#endif

#include <algorithm>
#include <cstdlib>
#include <string_view>
#include <thread>

#include "xct/core/Session.hpp"
#include "xct/core/utils/Strings.hpp"

::xct::Logger xct::Session::logger;
std::atomic<xct::i64> xct::Session::m_thread_limit{0};

void xct::Session::set_thread_limit(i64 n_threads) {
    if (n_threads > 0) {
        m_thread_limit = n_threads;
        return;
    }

    std::optional<i64> max_threads;
    std::string_view source;
    if (const char* str = std::getenv("XCT_THREADS")) {
        source = str;
        max_threads = parse<i64>(source);
    } else {
        #ifdef XCT_ENABLE_OPENMP
        if (const char* omp_str = std::getenv("OMP_NUM_THREADS")) {
            source = omp_str;
            max_threads = parse<i64>(source);
        } else {
            max_threads = static_cast<i64>(omp_get_max_threads());
        }
        #else
        max_threads = static_cast<i64>(std::thread::hardware_concurrency());
        #endif
    }
    if (not max_threads) {
        logger.warn("Invalid thread count in the environment: \"{}\". Using 1 thread", source);
        max_threads = 1;
    }
    m_thread_limit = std::max(*max_threads, i64{1});
}
