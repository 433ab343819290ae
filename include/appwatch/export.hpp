#ifndef APPWATCH_EXPORT_HPP
#define APPWATCH_EXPORT_HPP

/**
 * @file export.hpp
 * @brief Symbol visibility for the appwatch_core library
 *
 * The build defines APPWATCH_BUILDING_SHARED while compiling a shared
 * appwatch_core and exports APPWATCH_SHARED to everything linking it.
 * Static builds leave APPWATCH_API empty.
 *
 * Usage in headers:
 *   APPWATCH_API std::optional<ProcessId> find_successor(const std::string& dir);
 *   class APPWATCH_API Supervisor { ... };
 */

#if defined(_WIN32) || defined(_WIN64)
    #ifdef APPWATCH_BUILDING_SHARED
        #define APPWATCH_API __declspec(dllexport)
    #elif defined(APPWATCH_SHARED)
        #define APPWATCH_API __declspec(dllimport)
    #else
        #define APPWATCH_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #ifdef APPWATCH_BUILDING_SHARED
        #define APPWATCH_API __attribute__((visibility("default")))
    #else
        #define APPWATCH_API
    #endif
#else
    #define APPWATCH_API
#endif

#endif // APPWATCH_EXPORT_HPP
