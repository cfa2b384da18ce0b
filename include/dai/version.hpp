#pragma once

/// @file version.hpp
/// @brief dark_ai version and the root namespace.

#define DAI_VERSION_MAJOR 0
#define DAI_VERSION_MINOR 3
#define DAI_VERSION_PATCH 0
#define DAI_VERSION_STRING "0.3.0"

namespace dai {

struct Version {
    static constexpr const char* project = "dark_ai";
    static constexpr int major = DAI_VERSION_MAJOR;
    static constexpr int minor = DAI_VERSION_MINOR;
    static constexpr int patch = DAI_VERSION_PATCH;
    static constexpr const char* string = DAI_VERSION_STRING;
};

}  // namespace dai
