/**
 * @file export.hpp
 * @brief Symbol visibility macros for the gatelink_security library.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(GATELINK_SECURITY_BUILD)
        #define GATELINK_SECURITY_API __declspec(dllexport)
    #else
        #define GATELINK_SECURITY_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(GATELINK_SECURITY_BUILD)
        #define GATELINK_SECURITY_API __attribute__((visibility("default")))
    #else
        #define GATELINK_SECURITY_API
    #endif
#else
    #define GATELINK_SECURITY_API
#endif
