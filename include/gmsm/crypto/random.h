/**
 * @file random.h
 * @brief Injected randomness: byte sources and per-signature k generation
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#ifndef GMSM_CRYPTO_RANDOM_H
#define GMSM_CRYPTO_RANDOM_H

#include "gmsm/core/types.h"

#include <NTL/ZZ.h>

#include <memory>

namespace gmsm {

using NTL::ZZ;

/**
 * @brief Source of random bytes
 *
 * Implementations raise CryptoError (GMSM_ERROR_RANDOM_FAILED) when no
 * randomness can be produced; they never return short.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual void next_bytes(uint8_t* out, size_t len) = 0;
};

using RandomSourcePtr = std::shared_ptr<RandomSource>;

/**
 * @brief OS CSPRNG (getrandom / /dev/urandom)
 */
class SystemRandom : public RandomSource {
public:
    void next_bytes(uint8_t* out, size_t len) override;
};

/** Fresh SystemRandom behind the shared interface */
RandomSourcePtr make_system_random();

/**
 * @brief Uniform integer in [1, n-1]
 *
 * Draws bits(n)-bit candidates and rejects 0 and values >= n. There is no
 * fallback path: a source that keeps failing the range test for 128 draws
 * is treated as broken.
 *
 * @throws std::invalid_argument if n <= 1
 * @throws CryptoError if the source is exhausted or broken
 */
ZZ random_scalar(RandomSource& random, const ZZ& n);

// ============================================================================
// k generation for DSA-style signatures
// ============================================================================

class DSAKCalculator {
public:
    virtual ~DSAKCalculator() = default;

    virtual bool is_deterministic() const = 0;

    /**
     * @param n Group order
     * @param random Source for non-deterministic calculators
     */
    virtual void init(const ZZ& n, RandomSourcePtr random) = 0;

    /** Next k in [1, n-1] */
    virtual ZZ next_k() = 0;
};

class RandomDSAKCalculator : public DSAKCalculator {
public:
    bool is_deterministic() const override { return false; }
    void init(const ZZ& n, RandomSourcePtr random) override;

    /** @throws StateError before init() */
    ZZ next_k() override;

private:
    ZZ n_;
    RandomSourcePtr random_;
};

} // namespace gmsm

#endif // GMSM_CRYPTO_RANDOM_H
