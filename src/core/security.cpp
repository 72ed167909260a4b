/**
 * @file security.cpp
 * @brief Security primitives: constant-time compare, secure zero, CSPRNG
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#include "gmsm/core/security.h"
#include "gmsm/core/common.h"

#include <cstring>
#include <cstdint>

#include <sys/types.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>

#if defined(__linux__)
// sys/random.h needs glibc 2.25+, go through syscall() instead
#include <sys/syscall.h>
#ifdef SYS_getrandom
#define GMSM_HAS_GETRANDOM_SYSCALL 1
static inline ssize_t gmsm_getrandom(void* buf, size_t len, unsigned int flags) {
    return syscall(SYS_getrandom, buf, len, flags);
}
#endif
#endif

namespace gmsm {
namespace internal {

#if defined(__GNUC__) || defined(__clang__)
#define COMPILER_BARRIER() __asm__ __volatile__("" ::: "memory")
#else
#define COMPILER_BARRIER()
#endif

// ============================================================================
// Secure Memory Operations
// ============================================================================

// Volatile function pointer keeps the zeroing call from being optimized out
using SecureZeroFn = void (*volatile)(void*, size_t);

static void secure_zero_impl(void* ptr, size_t len) {
    volatile unsigned char* p = static_cast<volatile unsigned char*>(ptr);
    while (len--) {
        *p++ = 0;
    }
}

static SecureZeroFn secure_zero_ptr = secure_zero_impl;

void secure_zero(void* ptr, size_t len) {
    if (!ptr || len == 0) return;
    secure_zero_ptr(ptr, len);
    COMPILER_BARRIER();
}

bool secure_equal(const void* a, const void* b, size_t len) {
    if (!a || !b) return false;

    const volatile unsigned char* pa = static_cast<const volatile unsigned char*>(a);
    const volatile unsigned char* pb = static_cast<const volatile unsigned char*>(b);

    volatile unsigned char diff = 0;
    for (size_t i = 0; i < len; i++) {
        diff |= static_cast<unsigned char>(pa[i] ^ pb[i]);
    }

    COMPILER_BARRIER();

    return diff == 0;
}

// ============================================================================
// CSPRNG
// ============================================================================

static gmsm_error_t read_urandom(unsigned char* p, size_t remaining) {
    int fd = open("/dev/urandom", O_RDONLY | O_CLOEXEC);
    if (fd < 0) return GMSM_ERROR_RANDOM_FAILED;

    while (remaining > 0) {
        ssize_t ret = read(fd, p, remaining);
        if (ret < 0) {
            if (errno == EINTR) continue;
            close(fd);
            return GMSM_ERROR_RANDOM_FAILED;
        }
        if (ret == 0) {
            close(fd);
            return GMSM_ERROR_RANDOM_FAILED;
        }
        p += ret;
        remaining -= static_cast<size_t>(ret);
    }
    close(fd);
    return GMSM_SUCCESS;
}

gmsm_error_t random_bytes(void* buf, size_t len) {
    if (!buf) return GMSM_ERROR_INVALID_PARAM;
    if (len == 0) return GMSM_SUCCESS;

    unsigned char* p = static_cast<unsigned char*>(buf);
    size_t remaining = len;

#ifdef GMSM_HAS_GETRANDOM_SYSCALL
    while (remaining > 0) {
        ssize_t ret = gmsm_getrandom(p, remaining, 0);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;  // ENOSYS and friends: use /dev/urandom
        }
        p += ret;
        remaining -= static_cast<size_t>(ret);
    }
    if (remaining == 0) return GMSM_SUCCESS;
#endif

    return read_urandom(p, remaining);
}

}  // namespace internal
}  // namespace gmsm

// ============================================================================
// C ABI Exports
// ============================================================================

extern "C" {

void gmsm_secure_zero(void* ptr, size_t len) {
    gmsm::internal::secure_zero(ptr, len);
}

int gmsm_secure_compare(const void* a, const void* b, size_t len) {
    return gmsm::internal::secure_equal(a, b, len) ? 0 : 1;
}

gmsm_error_t gmsm_random_bytes(void* buf, size_t len) {
    return gmsm::internal::random_bytes(buf, len);
}

const char* gmsm_error_string(gmsm_error_t error) {
    switch (error) {
        case GMSM_SUCCESS:                   return "Success";
        case GMSM_ERROR_INVALID_PARAM:       return "Invalid parameter";
        case GMSM_ERROR_BUFFER_TOO_SMALL:    return "Buffer too small";
        case GMSM_ERROR_MEMORY_ALLOC:        return "Memory allocation failed";
        case GMSM_ERROR_INVALID_KEY:         return "Invalid key";
        case GMSM_ERROR_INVALID_POINT:       return "Invalid curve point";
        case GMSM_ERROR_ENCRYPTION_FAILED:   return "Encryption failed";
        case GMSM_ERROR_DECRYPTION_FAILED:   return "Decryption failed";
        case GMSM_ERROR_VERIFICATION_FAILED: return "Verification failed";
        case GMSM_ERROR_INPUT_TOO_SHORT:     return "Input too short";
        case GMSM_ERROR_INTERNAL:            return "Internal error";
        case GMSM_ERROR_AUTH_FAILED:         return "Authentication failed";
        case GMSM_ERROR_RANDOM_FAILED:       return "Random generation failed";
        case GMSM_ERROR_MATH_DOMAIN:         return "Math domain error";
    }
    return "Unknown error";
}

}  // extern "C"
