/**
 * @file fixed_random.h
 * @brief Scripted random sources for reproducible SM2 tests
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#ifndef GMSM_TESTS_SUPPORT_FIXED_RANDOM_H
#define GMSM_TESTS_SUPPORT_FIXED_RANDOM_H

#include "gmsm/core/errors.h"
#include "gmsm/crypto/random.h"
#include "gmsm/utils/encoding.h"

#include <cstring>
#include <deque>
#include <string>

namespace gmsm {
namespace test {

/**
 * @brief Hands out queued byte strings, one per next_bytes() call
 *
 * Each queued chunk must match the requested length. An empty queue
 * raises CryptoError like an exhausted OS source would.
 */
class FixedRandom : public RandomSource {
public:
    FixedRandom() = default;

    explicit FixedRandom(const std::string& hex) { push_hex(hex); }

    void push(const ByteVec& chunk) { chunks_.push_back(chunk); }
    void push_hex(const std::string& hex) { push(encoding::hexDecode(hex)); }

    void next_bytes(uint8_t* out, size_t len) override {
        if (chunks_.empty()) {
            throw CryptoError("FixedRandom exhausted", GMSM_ERROR_RANDOM_FAILED);
        }
        ByteVec chunk = chunks_.front();
        chunks_.pop_front();
        if (chunk.size() != len) {
            throw CryptoError("FixedRandom chunk has wrong length", GMSM_ERROR_RANDOM_FAILED);
        }
        std::memcpy(out, chunk.data(), len);
        ++calls_;
    }

    size_t remaining() const { return chunks_.size(); }
    size_t calls() const { return calls_; }

private:
    std::deque<ByteVec> chunks_;
    size_t calls_ = 0;
};

/**
 * @brief k calculator returning a fixed sequence of k values
 */
class FixedKCalculator : public DSAKCalculator {
public:
    void push(const ZZ& k) { ks_.push_back(k); }

    bool is_deterministic() const override { return true; }
    void init(const ZZ&, RandomSourcePtr) override {}

    ZZ next_k() override {
        if (ks_.empty()) {
            throw StateError("FixedKCalculator exhausted");
        }
        ZZ k = ks_.front();
        ks_.pop_front();
        return k;
    }

private:
    std::deque<ZZ> ks_;
};

} // namespace test
} // namespace gmsm

#endif // GMSM_TESTS_SUPPORT_FIXED_RANDOM_H
