/*
 * Version macros for evalforge.
 *
 * The build passes EVALFORGE_VERSION_MAJOR/MINOR/PATCH and EVALFORGE_VERSION_STRING as
 * compile definitions; the values below apply when it does not.
 */

#pragma once

#ifndef EVALFORGE_VERSION_MAJOR
#define EVALFORGE_VERSION_MAJOR 0
#endif

#ifndef EVALFORGE_VERSION_MINOR
#define EVALFORGE_VERSION_MINOR 0
#endif

#ifndef EVALFORGE_VERSION_PATCH
#define EVALFORGE_VERSION_PATCH 0
#endif

#ifndef EVALFORGE_VERSION_STRING
#define EVALFORGE_VERSION_STRING "0.0.0+dev"
#endif

#ifndef EVALFORGE_BUILD_DATE
#define EVALFORGE_BUILD_DATE __DATE__ " " __TIME__
#endif

// "X.Y.Z (built: Mon DD YYYY HH:MM:SS)"
#ifndef EVALFORGE_VERSION_LONG_STRING
#define EVALFORGE_VERSION_LONG_STRING                                                              \
    EVALFORGE_VERSION_STRING " (built: " EVALFORGE_BUILD_DATE ")"
#endif

#if defined(__cplusplus)
namespace evalforge {
namespace version {
constexpr int major_v = EVALFORGE_VERSION_MAJOR;
constexpr int minor_v = EVALFORGE_VERSION_MINOR;
constexpr int patch_v = EVALFORGE_VERSION_PATCH;
constexpr const char* string_v = EVALFORGE_VERSION_STRING;
constexpr const char* build_date_v = EVALFORGE_BUILD_DATE;
constexpr const char* long_string_v = EVALFORGE_VERSION_LONG_STRING;
} // namespace version
} // namespace evalforge
#endif
