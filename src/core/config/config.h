#pragma once

#ifndef CORE_CONFIG_CONFIG_H
#define CORE_CONFIG_CONFIG_H

#include <cstddef>
#include <cstdint>

// ==============================================================================
// Core Library Configuration
// ==============================================================================
// This file contains compile-time configuration, type definitions, and
// constants used throughout the library. For the runtime capture defaults,
// see capture_config.h
// ==============================================================================

namespace tracerr {
namespace config {

// ==============================================================================
// Version Information
// ==============================================================================

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "0.3.0";

// ==============================================================================
// Type Definitions
// ==============================================================================

using size_type = std::size_t;

// Source line numbers as reported by the stack walker
using line_type = std::size_t;

// ==============================================================================
// Platform Detection
// ==============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define CORE_PLATFORM_WINDOWS 1
    #define CORE_PLATFORM_NAME "Windows"
#elif defined(__APPLE__)
    #define CORE_PLATFORM_MACOS 1
    #define CORE_PLATFORM_NAME "macOS"
#elif defined(__linux__)
    #define CORE_PLATFORM_LINUX 1
    #define CORE_PLATFORM_NAME "Linux"
#elif defined(__unix__)
    #define CORE_PLATFORM_UNIX 1
    #define CORE_PLATFORM_NAME "Unix"
#else
    #define CORE_PLATFORM_UNKNOWN 1
    #define CORE_PLATFORM_NAME "Unknown"
#endif

// ==============================================================================
// Compiler Detection
// ==============================================================================

#if defined(__clang__)
    #define CORE_COMPILER_CLANG 1
    #define CORE_COMPILER_NAME "Clang"
#elif defined(__GNUC__)
    #define CORE_COMPILER_GCC 1
    #define CORE_COMPILER_NAME "GCC"
#elif defined(_MSC_VER)
    #define CORE_COMPILER_MSVC 1
    #define CORE_COMPILER_NAME "MSVC"
#else
    #define CORE_COMPILER_UNKNOWN 1
    #define CORE_COMPILER_NAME "Unknown"
#endif

// ==============================================================================
// Build Configuration
// ==============================================================================

#if defined(DEBUG) || defined(_DEBUG) || !defined(NDEBUG)
    #define CORE_DEBUG_BUILD 1
    #define CORE_BUILD_TYPE "Debug"
#else
    #define CORE_RELEASE_BUILD 1
    #define CORE_BUILD_TYPE "Release"
#endif

#ifndef CORE_ENABLE_LOGGING
    #define CORE_ENABLE_LOGGING 1
#endif

// ==============================================================================
// Stack Trace Defaults
// ==============================================================================

// Initial capacity reserved for a captured frame sequence. Only a hint:
// deeper stacks still produce every frame.
constexpr size_type DEFAULT_FRAME_CAPACITY = 20;

// Frames above the capturer's caller that belong to the library itself.
// Two covers the public entry point and its capturing helper.
constexpr size_type DEFAULT_FRAME_SKIP_COUNT = 2;

// Source context shown around a frame's line by the source printer
constexpr size_type DEFAULT_SOURCE_LINES_BEFORE = 3;
constexpr size_type DEFAULT_SOURCE_LINES_AFTER = 2;

// ==============================================================================
// Inline Macros
// ==============================================================================

// Functions whose frame is counted by the skip depth must keep that frame
#if defined(CORE_COMPILER_MSVC)
    #define CORE_NOINLINE __declspec(noinline)
#elif defined(CORE_COMPILER_GCC) || defined(CORE_COMPILER_CLANG)
    #define CORE_NOINLINE __attribute__((noinline))
#else
    #define CORE_NOINLINE
#endif

// ==============================================================================
// Attribute Macros
// ==============================================================================

#if defined(CORE_COMPILER_GCC) || defined(CORE_COMPILER_CLANG)
    #define CORE_PRINTF_FORMAT(fmt_index, args_index) \
        __attribute__((format(printf, fmt_index, args_index)))
#else
    #define CORE_PRINTF_FORMAT(fmt_index, args_index)
#endif

} // namespace config
} // namespace tracerr

#endif // CORE_CONFIG_CONFIG_H
