/**
 * @file export.hpp
 * @brief Symbol visibility macros for the uuidkit_net library.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(UUIDKIT_NET_BUILD)
        #define UUIDKIT_NET_API __declspec(dllexport)
    #else
        #define UUIDKIT_NET_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(UUIDKIT_NET_BUILD)
        #define UUIDKIT_NET_API __attribute__((visibility("default")))
    #else
        #define UUIDKIT_NET_API
    #endif
#else
    #define UUIDKIT_NET_API
#endif
