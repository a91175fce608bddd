// SPDX-License-Identifier: Apache-2.0

#pragma once

// PAPERWEIGHT_SHARED is set when Paperweight is built as, or linked against, a shared library.
// BUILD_PAPERWEIGHT is set only while building the library itself.

#if defined(_MSC_VER)
    #define PAPERWEIGHT_EXPORT       __declspec(dllexport)
    #define PAPERWEIGHT_IMPORT       __declspec(dllimport)
    #define PAPERWEIGHT_FORCE_INLINE __forceinline
#else
    #define PAPERWEIGHT_EXPORT       __attribute__((visibility("default")))
    #define PAPERWEIGHT_IMPORT       /*!*/
    #define PAPERWEIGHT_FORCE_INLINE inline __attribute__((always_inline))
#endif

#if !defined(PAPERWEIGHT_SHARED)
    #define PAPERWEIGHT_API /*!*/
#elif defined(BUILD_PAPERWEIGHT)
    #define PAPERWEIGHT_API PAPERWEIGHT_EXPORT
#else
    #define PAPERWEIGHT_API PAPERWEIGHT_IMPORT
#endif
