#pragma once

/**
 * @file Export.h
 * @brief Export/import macros for shared library support
 *
 * Build system should define one of:
 *   - PIXKIT_BUILD_SHARED: when building PixKit as shared library
 *   - PIXKIT_USE_SHARED: when using PixKit as shared library
 *   - PIXKIT_STATIC: when building/using as static library (default)
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(PIXKIT_BUILD_SHARED)
        #define PIXKIT_API __declspec(dllexport)
    #elif defined(PIXKIT_USE_SHARED)
        #define PIXKIT_API __declspec(dllimport)
    #else
        #define PIXKIT_API
    #endif
    #define PIXKIT_CALL __cdecl
#else
    #if defined(PIXKIT_BUILD_SHARED)
        #define PIXKIT_API __attribute__((visibility("default")))
    #else
        #define PIXKIT_API
    #endif
    #define PIXKIT_CALL
#endif
