/**
 * @file random.cpp
 * @brief Random byte sources and scalar sampling
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#include "gmsm/crypto/random.h"
#include "gmsm/core/errors.h"
#include "gmsm/core/security.h"
#include "gmsm/math/field_element.h"

#include <stdexcept>
#include <vector>

namespace gmsm {

namespace {
constexpr int MAX_SCALAR_TRIES = 128;
}

void SystemRandom::next_bytes(uint8_t* out, size_t len) {
    gmsm_error_t rc = gmsm_random_bytes(out, len);
    if (rc != GMSM_SUCCESS) {
        throw CryptoError("system random source failed", GMSM_ERROR_RANDOM_FAILED);
    }
}

RandomSourcePtr make_system_random() {
    return std::make_shared<SystemRandom>();
}

ZZ random_scalar(RandomSource& random, const ZZ& n) {
    if (n <= 1) {
        throw std::invalid_argument("random_scalar: order must be greater than 1");
    }

    const long bits = NTL::NumBits(n);
    const size_t nbytes = static_cast<size_t>((bits + 7) / 8);
    std::vector<uint8_t> buf(nbytes);

    for (int tries = 0; tries < MAX_SCALAR_TRIES; tries++) {
        random.next_bytes(buf.data(), nbytes);
        ZZ k = NTL::trunc_ZZ(math::zz_from_bytes_be(buf.data(), nbytes), bits);
        if (!NTL::IsZero(k) && k < n) {
            gmsm_secure_zero(buf.data(), buf.size());
            return k;
        }
    }

    gmsm_secure_zero(buf.data(), buf.size());
    throw CryptoError("random_scalar: no candidate in [1, n-1] after repeated draws",
                      GMSM_ERROR_RANDOM_FAILED);
}

void RandomDSAKCalculator::init(const ZZ& n, RandomSourcePtr random) {
    if (n <= 1) {
        throw std::invalid_argument("RandomDSAKCalculator: order must be greater than 1");
    }
    if (!random) {
        throw std::invalid_argument("RandomDSAKCalculator: null random source");
    }
    n_ = n;
    random_ = std::move(random);
}

ZZ RandomDSAKCalculator::next_k() {
    if (!random_) {
        throw StateError("RandomDSAKCalculator not initialized");
    }
    return random_scalar(*random_, n_);
}

} // namespace gmsm
