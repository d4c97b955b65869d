#pragma once

// =============================================================================
// 平台检测
// =============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifndef FORMFLOW_PLATFORM_WINDOWS
        #define FORMFLOW_PLATFORM_WINDOWS
    #endif
#elif defined(__APPLE__) && defined(__MACH__)
    #ifndef FORMFLOW_PLATFORM_MACOS
        #define FORMFLOW_PLATFORM_MACOS
    #endif
#elif defined(__linux__)
    #ifndef FORMFLOW_PLATFORM_LINUX
        #define FORMFLOW_PLATFORM_LINUX
    #endif
#endif

#if defined(FORMFLOW_PLATFORM_LINUX) || defined(FORMFLOW_PLATFORM_MACOS)
    #ifndef FORMFLOW_PLATFORM_POSIX
        #define FORMFLOW_PLATFORM_POSIX
    #endif
#endif

// =============================================================================
// 默认限制
// =============================================================================

/// part header 块的默认上限（字节）
#ifndef FORMFLOW_DEFAULT_MAX_HEADER_SIZE
    #define FORMFLOW_DEFAULT_MAX_HEADER_SIZE (16 * 1024)
#endif

/// RFC 2046: boundary 最长 70 字符
#define FORMFLOW_MAX_BOUNDARY_LENGTH 70

/// 落盘文件名的最大字节数
#define FORMFLOW_MAX_FILENAME_LENGTH 255

// =============================================================================
// 平台特定头文件
// =============================================================================

#ifdef FORMFLOW_PLATFORM_WINDOWS
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
#endif
