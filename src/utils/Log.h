// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Log.h
 * @brief Unified logging system for CoverLight
 *
 * Provides consistent, colored logging with automatic timestamps and component tags.
 *
 * Usage:
 *   #define CL_LOG_TAG "MyComponent"
 *   #include "utils/Log.h"
 *
 *   CL_LOGI("Initialized with %d items", count);
 *   CL_LOGE("Failed: %s (code=%d)", msg, err);
 *   CL_LOGW("Cache dir missing: %s", path);
 *   CL_LOGD("Debug value: %f", val);
 *
 * Output format (stderr, so stdout carries only patterns):
 *   [12345][INFO][MyComponent] Initialized with 5 items
 *   [12346][ERROR][MyComponent] Failed: timeout (code=-1)
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>

// ============================================================================
// ANSI Color Constants
// ============================================================================

#define CL_ANSI_RESET      "\033[0m"

#define CL_CLR_RED         "\033[1;31m"   // Errors
#define CL_CLR_MAGENTA     "\033[1;35m"   // Warnings
#define CL_CLR_GREEN       "\033[1;32m"   // Info
#define CL_CLR_GRAY        "\033[0;37m"   // Debug (dim)

// Semantic aliases for log levels
#define CL_CLR_ERROR       CL_CLR_RED
#define CL_CLR_WARN        CL_CLR_MAGENTA
#define CL_CLR_INFO        CL_CLR_GREEN
#define CL_CLR_DEBUG       CL_CLR_GRAY
#define CL_CLR_VERBOSE     CL_CLR_GRAY    // Alias for domain-aware macros
#define CL_CLR_TRACE       CL_CLR_GRAY

// ============================================================================
// Log Level Configuration
// ============================================================================
// Set via CMake:
//   -DCL_LOG_LEVEL=3   (0=None, 1=Error, 2=Warn, 3=Info, 4=Debug)
//
// Default: Warn in NDEBUG builds, Info otherwise

#ifndef CL_LOG_LEVEL
    #ifdef NDEBUG
        #define CL_LOG_LEVEL 2   // Release: Warn and above
    #else
        #define CL_LOG_LEVEL 3   // Debug: Info and above
    #endif
#endif

#define CL_LOG_LEVEL_NONE  0
#define CL_LOG_LEVEL_ERROR 1
#define CL_LOG_LEVEL_WARN  2
#define CL_LOG_LEVEL_INFO  3
#define CL_LOG_LEVEL_DEBUG 4

// ============================================================================
// Clock and sink
// ============================================================================

static inline uint32_t _cl_log_millis() {
    static const std::chrono::steady_clock::time_point s_start = std::chrono::steady_clock::now();
    return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - s_start).count());
}

#define CL_LOG_MILLIS()    _cl_log_millis()
#define CL_LOG_PRINTF(...) std::fprintf(stderr, __VA_ARGS__)

// ============================================================================
// Core Logging Macros
// ============================================================================
// Format: [timestamp][LEVEL][TAG] message

#ifndef CL_LOG_TAG
    #define CL_LOG_TAG "CL"
#endif

#define CL_LOG_FORMAT(level_str, level_color, fmt) \
    "[%lu]" level_color "[" level_str "]" CL_ANSI_RESET "[" CL_LOG_TAG "] " fmt "\n"

#if CL_LOG_LEVEL >= CL_LOG_LEVEL_ERROR
    #define CL_LOGE(fmt, ...) \
        CL_LOG_PRINTF(CL_LOG_FORMAT("ERROR", CL_CLR_ERROR, fmt), \
                      (unsigned long)CL_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define CL_LOGE(fmt, ...) ((void)0)
#endif

#if CL_LOG_LEVEL >= CL_LOG_LEVEL_WARN
    #define CL_LOGW(fmt, ...) \
        CL_LOG_PRINTF(CL_LOG_FORMAT("WARN", CL_CLR_WARN, fmt), \
                      (unsigned long)CL_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define CL_LOGW(fmt, ...) ((void)0)
#endif

#if CL_LOG_LEVEL >= CL_LOG_LEVEL_INFO
    #define CL_LOGI(fmt, ...) \
        CL_LOG_PRINTF(CL_LOG_FORMAT("INFO", CL_CLR_INFO, fmt), \
                      (unsigned long)CL_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define CL_LOGI(fmt, ...) ((void)0)
#endif

#if CL_LOG_LEVEL >= CL_LOG_LEVEL_DEBUG
    #define CL_LOGD(fmt, ...) \
        CL_LOG_PRINTF(CL_LOG_FORMAT("DEBUG", CL_CLR_DEBUG, fmt), \
                      (unsigned long)CL_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define CL_LOGD(fmt, ...) ((void)0)
#endif

// ============================================================================
// Domain-Aware Logging Macros
// ============================================================================
// These macros check the runtime DebugConfig to determine if logging should occur.
//
// Usage:
//   CL_EXTRACT_LOGI("Quantized to %u entries", count);
//   CL_NET_LOGW("HTTP %ld for %s", status, url);
//
// Levels:
//   E = ERROR   (1) - Actual failures
//   W = WARN    (2) - Actionable warnings
//   I = INFO    (3) - Significant events
//   D = VERBOSE (4) - Diagnostic values (named VERBOSE to avoid DEBUG macro conflict)
//   T = TRACE   (5) - Everything (per-pixel, per-entry)
//
// Configuration via command line:
//   --log-level 3              - Set global level to INFO
//   --log-domain extract=5     - Set extract domain to TRACE

#include "config/DebugConfig.h"

#define CL_DOMAIN_LOG(domain, level, fmt, ...) \
    do { \
        if (coverlight::config::getDebugConfig().shouldLog( \
                coverlight::config::DebugDomain::domain, \
                coverlight::config::DebugLevel::level)) { \
            CL_LOG_PRINTF(CL_LOG_FORMAT(#level, CL_CLR_##level, fmt), \
                          (unsigned long)CL_LOG_MILLIS(), ##__VA_ARGS__); \
        } \
    } while(0)

// ----------------------------------------------------------------------------
// Extract Domain Logging
// ----------------------------------------------------------------------------
// Use for: digest palettes, image decode, downscale, quantization, top-up
#define CL_EXTRACT_LOGE(fmt, ...) CL_DOMAIN_LOG(EXTRACT, ERROR, fmt, ##__VA_ARGS__)
#define CL_EXTRACT_LOGW(fmt, ...) CL_DOMAIN_LOG(EXTRACT, WARN, fmt, ##__VA_ARGS__)
#define CL_EXTRACT_LOGI(fmt, ...) CL_DOMAIN_LOG(EXTRACT, INFO, fmt, ##__VA_ARGS__)
#define CL_EXTRACT_LOGD(fmt, ...) CL_DOMAIN_LOG(EXTRACT, VERBOSE, fmt, ##__VA_ARGS__)
#define CL_EXTRACT_LOGT(fmt, ...) CL_DOMAIN_LOG(EXTRACT, TRACE, fmt, ##__VA_ARGS__)

// ----------------------------------------------------------------------------
// Pattern Domain Logging
// ----------------------------------------------------------------------------
// Use for: pattern generation, rotation phase changes
#define CL_PATTERN_LOGE(fmt, ...) CL_DOMAIN_LOG(PATTERN, ERROR, fmt, ##__VA_ARGS__)
#define CL_PATTERN_LOGW(fmt, ...) CL_DOMAIN_LOG(PATTERN, WARN, fmt, ##__VA_ARGS__)
#define CL_PATTERN_LOGI(fmt, ...) CL_DOMAIN_LOG(PATTERN, INFO, fmt, ##__VA_ARGS__)
#define CL_PATTERN_LOGD(fmt, ...) CL_DOMAIN_LOG(PATTERN, VERBOSE, fmt, ##__VA_ARGS__)
#define CL_PATTERN_LOGT(fmt, ...) CL_DOMAIN_LOG(PATTERN, TRACE, fmt, ##__VA_ARGS__)

// ----------------------------------------------------------------------------
// Network Domain Logging
// ----------------------------------------------------------------------------
// Use for: artwork retrieval, temp artifacts
#define CL_NET_LOGE(fmt, ...) CL_DOMAIN_LOG(NETWORK, ERROR, fmt, ##__VA_ARGS__)
#define CL_NET_LOGW(fmt, ...) CL_DOMAIN_LOG(NETWORK, WARN, fmt, ##__VA_ARGS__)
#define CL_NET_LOGI(fmt, ...) CL_DOMAIN_LOG(NETWORK, INFO, fmt, ##__VA_ARGS__)
#define CL_NET_LOGD(fmt, ...) CL_DOMAIN_LOG(NETWORK, VERBOSE, fmt, ##__VA_ARGS__)
#define CL_NET_LOGT(fmt, ...) CL_DOMAIN_LOG(NETWORK, TRACE, fmt, ##__VA_ARGS__)

// ----------------------------------------------------------------------------
// System Domain Logging
// ----------------------------------------------------------------------------
// Use for: startup, config loading, poll loop, snapshot writes
#define CL_SYS_LOGE(fmt, ...) CL_DOMAIN_LOG(SYSTEM, ERROR, fmt, ##__VA_ARGS__)
#define CL_SYS_LOGW(fmt, ...) CL_DOMAIN_LOG(SYSTEM, WARN, fmt, ##__VA_ARGS__)
#define CL_SYS_LOGI(fmt, ...) CL_DOMAIN_LOG(SYSTEM, INFO, fmt, ##__VA_ARGS__)
#define CL_SYS_LOGD(fmt, ...) CL_DOMAIN_LOG(SYSTEM, VERBOSE, fmt, ##__VA_ARGS__)
#define CL_SYS_LOGT(fmt, ...) CL_DOMAIN_LOG(SYSTEM, TRACE, fmt, ##__VA_ARGS__)
