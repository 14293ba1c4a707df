// api.h - DLL export/import macros for faunadb

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for the faunadb library.
///
/// Usage:
/// - When building faunadb as a SHARED library:
///   - CMake defines FAUNADB_EXPORTS (private) and FAUNADB_SHARED (public)
///   - Functions/classes marked with FAUNADB_API will be exported
///
/// - When using faunadb as a SHARED library:
///   - Link against the faunadb target (CMake propagates FAUNADB_SHARED)
///
/// - When building/using as a STATIC library:
///   - No macros defined, FAUNADB_API expands to nothing

#if defined(_WIN32) || defined(_WIN64)
    #ifdef FAUNADB_SHARED
        #ifdef FAUNADB_EXPORTS
            #define FAUNADB_API __declspec(dllexport)
        #else
            #define FAUNADB_API __declspec(dllimport)
        #endif
    #else
        #define FAUNADB_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(FAUNADB_SHARED) && defined(FAUNADB_EXPORTS)
        #define FAUNADB_API __attribute__((visibility("default")))
    #else
        #define FAUNADB_API
    #endif
#else
    #define FAUNADB_API
#endif
