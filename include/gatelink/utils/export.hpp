/**
 * @file export.hpp
 * @brief Symbol visibility macros for the gatelink_utils library.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(GATELINK_UTILS_BUILD)
        #define GATELINK_UTILS_API __declspec(dllexport)
    #else
        #define GATELINK_UTILS_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(GATELINK_UTILS_BUILD)
        #define GATELINK_UTILS_API __attribute__((visibility("default")))
    #else
        #define GATELINK_UTILS_API
    #endif
#else
    #define GATELINK_UTILS_API
#endif
