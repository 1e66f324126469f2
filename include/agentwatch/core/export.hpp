/**
 * @file export.hpp
 * @brief Symbol visibility macros for the agentwatch_core library.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(AGENTWATCH_CORE_BUILD)
        #define AGENTWATCH_CORE_API __declspec(dllexport)
    #else
        #define AGENTWATCH_CORE_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(AGENTWATCH_CORE_BUILD)
        #define AGENTWATCH_CORE_API __attribute__((visibility("default")))
    #else
        #define AGENTWATCH_CORE_API
    #endif
#else
    #define AGENTWATCH_CORE_API
#endif
