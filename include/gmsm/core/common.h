/**
 * @file common.h
 * @brief Common definitions, error codes and utility macros for gmsm
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#ifndef GMSM_CORE_COMMON_H
#define GMSM_CORE_COMMON_H

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Platform detection
// ============================================================================
#if defined(_WIN32) || defined(_WIN64)
    #define GMSM_PLATFORM_WINDOWS 1
    #define GMSM_PLATFORM_NAME "Windows"
#elif defined(__linux__)
    #define GMSM_PLATFORM_LINUX 1
    #define GMSM_PLATFORM_NAME "Linux"
#elif defined(__APPLE__)
    #define GMSM_PLATFORM_MACOS 1
    #define GMSM_PLATFORM_NAME "macOS"
#else
    #define GMSM_PLATFORM_UNKNOWN 1
    #define GMSM_PLATFORM_NAME "Unknown"
#endif

// ============================================================================
// Export/Import macros for shared library
// ============================================================================
#ifdef GMSM_PLATFORM_WINDOWS
    #ifdef GMSM_SHARED_LIBRARY
        #ifdef GMSM_BUILDING
            #define GMSM_API __declspec(dllexport)
        #else
            #define GMSM_API __declspec(dllimport)
        #endif
    #else
        #define GMSM_API
    #endif
#else
    #ifdef GMSM_SHARED_LIBRARY
        #define GMSM_API __attribute__((visibility("default")))
    #else
        #define GMSM_API
    #endif
#endif

// ============================================================================
// Error codes
// ============================================================================
typedef enum {
    GMSM_SUCCESS = 0,
    GMSM_ERROR_INVALID_PARAM = -1,
    GMSM_ERROR_BUFFER_TOO_SMALL = -2,
    GMSM_ERROR_MEMORY_ALLOC = -3,
    GMSM_ERROR_INVALID_KEY = -4,
    GMSM_ERROR_INVALID_POINT = -5,
    GMSM_ERROR_ENCRYPTION_FAILED = -6,
    GMSM_ERROR_DECRYPTION_FAILED = -7,
    GMSM_ERROR_VERIFICATION_FAILED = -8,
    GMSM_ERROR_INPUT_TOO_SHORT = -9,
    GMSM_ERROR_INTERNAL = -10,
    GMSM_ERROR_AUTH_FAILED = -11,       // C3 or confirmation tag mismatch
    GMSM_ERROR_RANDOM_FAILED = -12,     // CSPRNG failure
    GMSM_ERROR_MATH_DOMAIN = -13        // No inverse / singular curve
} gmsm_error_t;

// Sizes
#define GMSM_SM3_DIGEST_SIZE         32
#define GMSM_SM3_BLOCK_SIZE          64
#define GMSM_SM2_FIELD_SIZE          32
#define GMSM_SM2_PRIVATE_KEY_SIZE    32
#define GMSM_SM2_PUBLIC_KEY_SIZE     65   // 04 || x || y
#define GMSM_SM2_SIGNATURE_RAW_SIZE  64   // r || s
#define GMSM_SM2_SIGNATURE_MAX_DER   72
#define GMSM_SM2_CIPHERTEXT_OVERHEAD (GMSM_SM2_PUBLIC_KEY_SIZE + GMSM_SM3_DIGEST_SIZE)

// Utility macros
#define GMSM_ARRAY_SIZE(arr) (sizeof(arr) / sizeof((arr)[0]))
#define GMSM_MIN(a, b) ((a) < (b) ? (a) : (b))

#define GMSM_ROTL32(x, n) ((uint32_t)(((x) << (n)) | ((x) >> (32 - (n)))))

/**
 * @brief Get error message for error code
 * @param error Error code
 * @return Human-readable error message
 */
GMSM_API const char* gmsm_error_string(gmsm_error_t error);

#ifdef __cplusplus
}
#endif

// ============================================================================
// Debug logging (compiled in with GMSM_DEBUG_SM2)
// ============================================================================
#ifdef __cplusplus
#ifdef GMSM_DEBUG_SM2
#include <iostream>
#define GMSM_DEBUG_LOG(msg) \
    do { std::cerr << "[gmsm:debug] " << msg << std::endl; } while (0)
#else
#define GMSM_DEBUG_LOG(msg) do { } while (0)
#endif
#endif // __cplusplus

#endif // GMSM_CORE_COMMON_H
