#pragma once

// ===== 平台检测 =====
#if defined(__linux__)
    #define SPLASH_PLATFORM_LINUX 1
#elif defined(_WIN32)
    #define SPLASH_PLATFORM_WINDOWS 1
#elif defined(__APPLE__)
    #define SPLASH_PLATFORM_MACOS 1
#endif

#if defined(SPLASH_PLATFORM_LINUX) || defined(SPLASH_PLATFORM_MACOS)
    #define SPLASH_PLATFORM_POSIX 1
#endif

// ===== Tail 轮询 =====
// Interval between two content comparisons of the watched file.
#ifndef SPLASH_POLL_INTERVAL_MS
    #define SPLASH_POLL_INTERVAL_MS 2000
#endif

// Size of one read() when pulling a delta batch.
#ifndef SPLASH_READ_CHUNK_SIZE
    #define SPLASH_READ_CHUNK_SIZE 65536
#endif

// ===== 插件搜索路径 =====
#ifndef SPLASH_PLUGIN_DIR_NAME
    #define SPLASH_PLUGIN_DIR_NAME "splash"
#endif

// ===== 日志消息最大长度 =====
#ifndef SPLASH_LOG_MAX_MSG_LEN
    #define SPLASH_LOG_MAX_MSG_LEN 512
#endif

// ===== 编译信息注入（CMake 设置） =====
#ifndef SPLASH_VERSION
    #define SPLASH_VERSION "0.0.0"
#endif
#ifndef SPLASH_GIT_HASH
    #define SPLASH_GIT_HASH "unknown"
#endif
#ifndef SPLASH_BUILD_TYPE
    #define SPLASH_BUILD_TYPE "unknown"
#endif
