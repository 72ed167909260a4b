/**
 * @file security.h
 * @brief Constant-time comparison, secure zeroing and OS randomness
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#ifndef GMSM_CORE_SECURITY_H
#define GMSM_CORE_SECURITY_H

#include "gmsm/core/common.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Constant-time memory comparison
 *
 * Execution time depends only on len, never on the buffer contents.
 *
 * @param a First memory region
 * @param b Second memory region
 * @param len Number of bytes to compare
 * @return 0 if equal, non-zero if different (never the position)
 */
GMSM_API int gmsm_secure_compare(const void* a, const void* b, size_t len);

/**
 * @brief Zero memory in a way the compiler may not elide
 * @param ptr Pointer to memory to zero
 * @param len Number of bytes to zero
 */
GMSM_API void gmsm_secure_zero(void* ptr, size_t len);

/**
 * @brief Fill a buffer from the OS CSPRNG
 *
 * Linux: getrandom() syscall, falling back to /dev/urandom.
 *
 * @param buf Buffer to fill
 * @param len Number of bytes
 * @return GMSM_SUCCESS, GMSM_ERROR_INVALID_PARAM or GMSM_ERROR_RANDOM_FAILED
 */
GMSM_API gmsm_error_t gmsm_random_bytes(void* buf, size_t len);

#ifdef __cplusplus
} // extern "C"

namespace gmsm {

/**
 * @brief Constant-time equality for byte containers
 *
 * Length is not secret: containers of different sizes compare unequal
 * immediately.
 */
template<typename Container>
bool secure_compare(const Container& a, const Container& b) {
    if (a.size() != b.size()) return false;
    return gmsm_secure_compare(a.data(), b.data(),
                               a.size() * sizeof(typename Container::value_type)) == 0;
}

/**
 * @brief Zero a container's storage in place
 */
template<typename Container>
void secure_wipe(Container& c) {
    if (!c.empty()) {
        gmsm_secure_zero(c.data(), c.size() * sizeof(typename Container::value_type));
    }
}

} // namespace gmsm

#endif // __cplusplus

#endif // GMSM_CORE_SECURITY_H
