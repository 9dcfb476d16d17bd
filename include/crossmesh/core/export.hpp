/**
 * @file export.hpp
 * @brief Symbol visibility macros for the crossmesh_core library.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(CROSSMESH_CORE_BUILD)
        #define CROSSMESH_CORE_API __declspec(dllexport)
    #else
        #define CROSSMESH_CORE_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(CROSSMESH_CORE_BUILD)
        #define CROSSMESH_CORE_API __attribute__((visibility("default")))
    #else
        #define CROSSMESH_CORE_API
    #endif
#else
    #define CROSSMESH_CORE_API
#endif
