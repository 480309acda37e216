#pragma once

// major * 10000 + minor * 100 + patch.
#define XCT_VERSION 000100
#define XCT_VERSION_STRING "000100"

#define XCT_URL "https://github.com/xct-project/xct"

namespace xct {
    constexpr const char* VERSION = XCT_VERSION_STRING;
    constexpr const char* URL = XCT_URL;
}
