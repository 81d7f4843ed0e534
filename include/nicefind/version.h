#pragma once

#include <string_view>

#ifndef NICEFIND_VERSION_MAJOR
#define NICEFIND_VERSION_MAJOR 0
#endif

#ifndef NICEFIND_VERSION_MINOR
#define NICEFIND_VERSION_MINOR 0
#endif

#ifndef NICEFIND_VERSION_STRING
#define NICEFIND_VERSION_STRING "0.0"
#endif

namespace nicefind {

inline constexpr int kVersionMajor = NICEFIND_VERSION_MAJOR;
inline constexpr int kVersionMinor = NICEFIND_VERSION_MINOR;
inline constexpr std::string_view kVersion{NICEFIND_VERSION_STRING};

} // namespace nicefind
