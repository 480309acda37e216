// This is the entry point to ALL benchmarks.
// Use --benchmark_filter=<regex> to run specific benchmarks.

#include <xct/core/Session.hpp>
#include <benchmark/benchmark.h>

int main(int argc, char** argv) {
    // Benchmarks are run without logging, with the thread limit from XCT_THREADS.
    const xct::Session session("xct_benchmarks", "", xct::Logger::SILENT);

    ::benchmark::Initialize(&argc, argv);
    if (::benchmark::ReportUnrecognizedArguments(argc, argv))
        return 1;
    ::benchmark::RunSpecifiedBenchmarks();
    ::benchmark::Shutdown();
    return 0;
}
