#pragma once

// Compiler and linkage configuration shared by the UOM headers.

#if defined(_MSC_VER) && !defined(__clang__)
#define UOM_ALWAYS_INLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
#define UOM_ALWAYS_INLINE inline __attribute__((always_inline))
#else
#define UOM_ALWAYS_INLINE inline
#endif

#ifndef UOM_API
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(UOM_SHARED_BUILD)
#define UOM_API __declspec(dllexport)
#elif defined(UOM_SHARED)
#define UOM_API __declspec(dllimport)
#else
#define UOM_API
#endif
#else
#if defined(UOM_SHARED_BUILD) || defined(UOM_SHARED)
#define UOM_API __attribute__((visibility("default")))
#else
#define UOM_API
#endif
#endif
#endif
