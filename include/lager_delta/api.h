// api.h - symbol visibility macros for lager_delta

#pragma once

/// @file api.h
/// @brief Export/import decoration for the lager_delta library.
///
/// The build defines LAGER_DELTA_SHARED (public) and LAGER_DELTA_EXPORTS
/// (private) when lager_delta is built as a shared library. A static build
/// defines neither and LAGER_DELTA_API expands to nothing.
///
/// @code
/// class LAGER_DELTA_API Differ { ... };
/// LAGER_DELTA_API Patch diff(const Value& a, const Value& b);
/// @endcode

#if defined(_WIN32) || defined(_WIN64)
    #ifdef LAGER_DELTA_SHARED
        #ifdef LAGER_DELTA_EXPORTS
            #define LAGER_DELTA_API __declspec(dllexport)
        #else
            #define LAGER_DELTA_API __declspec(dllimport)
        #endif
    #else
        #define LAGER_DELTA_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(LAGER_DELTA_SHARED) && defined(LAGER_DELTA_EXPORTS)
        #define LAGER_DELTA_API __attribute__((visibility("default")))
    #else
        #define LAGER_DELTA_API
    #endif
#else
    #define LAGER_DELTA_API
#endif

// Explicit template instantiation helpers.
// Header: LAGER_DELTA_EXTERN_TEMPLATE struct BasicValue<policy>;
#define LAGER_DELTA_EXTERN_TEMPLATE extern template
