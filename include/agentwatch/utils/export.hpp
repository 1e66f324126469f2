/**
 * @file export.hpp
 * @brief Symbol visibility macros for the agentwatch_utils library.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(AGENTWATCH_UTILS_BUILD)
        #define AGENTWATCH_UTILS_API __declspec(dllexport)
    #else
        #define AGENTWATCH_UTILS_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(AGENTWATCH_UTILS_BUILD)
        #define AGENTWATCH_UTILS_API __attribute__((visibility("default")))
    #else
        #define AGENTWATCH_UTILS_API
    #endif
#else
    #define AGENTWATCH_UTILS_API
#endif
