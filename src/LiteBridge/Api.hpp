// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(__GNUC__)
    #define LITEBRIDGE_NO_EXPORT    __attribute__((visibility("hidden")))
    #define LITEBRIDGE_EXPORT       __attribute__((visibility("default")))
    #define LITEBRIDGE_IMPORT       /*!*/
    #define LITEBRIDGE_FORCE_INLINE __attribute__((always_inline))
#elif defined(_MSC_VER)
    #define LITEBRIDGE_NO_EXPORT    /*!*/
    #define LITEBRIDGE_EXPORT       __declspec(dllexport)
    #define LITEBRIDGE_IMPORT       __declspec(dllimport)
    #define LITEBRIDGE_FORCE_INLINE __forceinline
#endif

#if defined(LITEBRIDGE_SHARED)
    #if defined(BUILD_LITEBRIDGE)
        #define LITEBRIDGE_API LITEBRIDGE_EXPORT
    #else
        #define LITEBRIDGE_API LITEBRIDGE_IMPORT
    #endif
#else
    #define LITEBRIDGE_API /*!*/
#endif
