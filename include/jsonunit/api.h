// api.h - DLL export/import macros for jsonunit

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for the jsonunit library.
///
/// Usage:
/// - When building jsonunit as a SHARED library:
///   - CMake defines JSONUNIT_EXPORTS (private) and JSONUNIT_SHARED (public)
///   - Functions/classes marked with JSONUNIT_API will be exported
///
/// - When using jsonunit as a SHARED library:
///   - Link against the jsonunit target (CMake propagates JSONUNIT_SHARED)
///   - Functions/classes marked with JSONUNIT_API will be imported
///
/// - When building/using as a STATIC library:
///   - No macros defined, JSONUNIT_API expands to nothing

#if defined(_WIN32) || defined(_WIN64)
    #ifdef JSONUNIT_SHARED
        #ifdef JSONUNIT_EXPORTS
            #define JSONUNIT_API __declspec(dllexport)
        #else
            #define JSONUNIT_API __declspec(dllimport)
        #endif
    #else
        #define JSONUNIT_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(JSONUNIT_SHARED) && defined(JSONUNIT_EXPORTS)
        #define JSONUNIT_API __attribute__((visibility("default")))
    #else
        #define JSONUNIT_API
    #endif
#else
    #define JSONUNIT_API
#endif
