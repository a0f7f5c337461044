// api.h - Symbol export/import macros for change_detect

#pragma once

/// @file api.h
/// @brief Cross-platform export/import macros for the change_detect library.
///
/// - Building change_detect as a SHARED library: CMake defines
///   CHANGE_DETECT_EXPORTS (private) and CHANGE_DETECT_SHARED (public).
/// - Consuming the shared library: only CHANGE_DETECT_SHARED is visible.
/// - Static builds: CHANGE_DETECT_API expands to nothing.

#if defined(_WIN32) || defined(_WIN64)
    #ifdef CHANGE_DETECT_SHARED
        #ifdef CHANGE_DETECT_EXPORTS
            #define CHANGE_DETECT_API __declspec(dllexport)
        #else
            #define CHANGE_DETECT_API __declspec(dllimport)
        #endif
    #else
        #define CHANGE_DETECT_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(CHANGE_DETECT_SHARED) && defined(CHANGE_DETECT_EXPORTS)
        #define CHANGE_DETECT_API __attribute__((visibility("default")))
    #else
        #define CHANGE_DETECT_API
    #endif
#else
    #define CHANGE_DETECT_API
#endif

#if defined(__GNUC__) || defined(__clang__)
    #define CHANGE_DETECT_DEPRECATED(msg) __attribute__((deprecated(msg)))
#elif defined(_MSC_VER)
    #define CHANGE_DETECT_DEPRECATED(msg) __declspec(deprecated(msg))
#else
    #define CHANGE_DETECT_DEPRECATED(msg)
#endif
