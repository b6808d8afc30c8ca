// api.h - DLL export/import macros for deep_delta

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for the deep_delta library.
///
/// - Building deep_delta as a SHARED library: CMake defines DEEP_DELTA_EXPORTS
///   (private) and DEEP_DELTA_SHARED (public); DEEP_DELTA_API exports symbols.
/// - Using deep_delta as a SHARED library: DEEP_DELTA_SHARED is propagated by the
///   target and DEEP_DELTA_API imports symbols.
/// - STATIC builds: DEEP_DELTA_API expands to nothing.

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef DEEP_DELTA_SHARED
        #ifdef DEEP_DELTA_EXPORTS
            #define DEEP_DELTA_API __declspec(dllexport)
        #else
            #define DEEP_DELTA_API __declspec(dllimport)
        #endif
    #else
        #define DEEP_DELTA_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(DEEP_DELTA_SHARED) && defined(DEEP_DELTA_EXPORTS)
        #define DEEP_DELTA_API __attribute__((visibility("default")))
    #else
        #define DEEP_DELTA_API
    #endif
#else
    #define DEEP_DELTA_API
#endif

// ============================================================
// Deprecation Warnings
// ============================================================

#if defined(__GNUC__) || defined(__clang__)
    #define DEEP_DELTA_DEPRECATED(msg) __attribute__((deprecated(msg)))
#elif defined(_MSC_VER)
    #define DEEP_DELTA_DEPRECATED(msg) __declspec(deprecated(msg))
#else
    #define DEEP_DELTA_DEPRECATED(msg)
#endif
