#pragma once

/// \file export.h
/// \brief Visibility/export macros for shared library builds.

#ifdef LABELSHEET_STATIC
    #define LABELSHEET_API
#elif defined(LABELSHEET_BUILDING)
    #if defined(_MSC_VER)
        #define LABELSHEET_API __declspec(dllexport)
    #elif defined(__GNUC__) || defined(__clang__)
        #define LABELSHEET_API __attribute__((visibility("default")))
    #else
        #define LABELSHEET_API
    #endif
#else
    #if defined(_MSC_VER)
        #define LABELSHEET_API __declspec(dllimport)
    #else
        #define LABELSHEET_API
    #endif
#endif
