#ifndef CLIAPP_EXPORT_HPP
#define CLIAPP_EXPORT_HPP

/**
 * @file export.hpp
 * @brief Shared library export/import macros.
 *
 * When building cliapp as a shared library:
 * - Define CLIAPP_SHARED when using the library
 * - CLIAPP_BUILDING_SHARED is defined by the build during library compilation
 */

#if defined(_WIN32) || defined(_WIN64)
    #ifdef CLIAPP_BUILDING_SHARED
        #define CLIAPP_API __declspec(dllexport)
    #elif defined(CLIAPP_SHARED)
        #define CLIAPP_API __declspec(dllimport)
    #else
        #define CLIAPP_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #ifdef CLIAPP_BUILDING_SHARED
        #define CLIAPP_API __attribute__((visibility("default")))
    #else
        #define CLIAPP_API
    #endif
#else
    #define CLIAPP_API
#endif

#endif // CLIAPP_EXPORT_HPP
