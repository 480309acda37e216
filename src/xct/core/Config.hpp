#pragma once

#include "xct/Version.hpp"

// Platform detection.
#if defined(_WIN64) || defined(__APPLE__) || defined(__MACH__) || defined(__ANDROID__)
#   error "Platform is not supported"
#elif defined(__linux__)
#   define XCT_PLATFORM_LINUX
#else
#   error "Unknown platform!"
#endif

// Detect host compiler
#if defined(__clang__)
#   define XCT_COMPILER_CLANG
#elif defined(__GNUG__)
#   define XCT_COMPILER_GCC
#elif defined(_MSC_VER)
#   define XCT_COMPILER_MSVC
#endif

// Assertions.
// These are for internal invariants only. Invalid user inputs are reported with exceptions.
#ifdef XCT_DEBUG
#   include <cassert>
#   define XCT_ASSERT(cond) assert(cond)
#else
#   define XCT_ASSERT(cond)
#endif
