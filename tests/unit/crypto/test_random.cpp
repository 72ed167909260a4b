/**
 * @file test_random.cpp
 * @brief Random sources and scalar sampling tests
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>
#include <memory>

#include "gmsm/core/errors.h"
#include "gmsm/core/security.h"
#include "gmsm/crypto/random.h"
#include "support/fixed_random.h"

using namespace gmsm;
using gmsm::test::FixedRandom;

TEST(RandomTest, SystemRandomFillsBuffer) {
    SystemRandom random;
    ByteVec a(64, 0), b(64, 0);
    random.next_bytes(a.data(), a.size());
    random.next_bytes(b.data(), b.size());
    EXPECT_NE(a, b);
    EXPECT_EQ(gmsm_random_bytes(a.data(), a.size()), GMSM_SUCCESS);
}

TEST(RandomTest, ScalarRejectsZeroAndOutOfRange) {
    // n = 1000 (10 bits, 2 bytes): 0 and 0x3FF are rejected, 0x0123 accepted
    FixedRandom random;
    random.push_hex("0000");
    random.push_hex("FFFF");   // truncated to 1023 >= 1000
    random.push_hex("FD23");   // truncated to 0x123 = 291
    EXPECT_EQ(random_scalar(random, ZZ(1000)), ZZ(291));
    EXPECT_EQ(random.calls(), 3u);
}

TEST(RandomTest, ScalarGivesUpAfterRepeatedRejections) {
    FixedRandom random;
    for (int i = 0; i < 128; ++i) {
        random.push_hex("0000");
    }
    try {
        random_scalar(random, ZZ(1000));
        FAIL() << "expected CryptoError";
    } catch (const CryptoError& e) {
        EXPECT_EQ(e.code(), GMSM_ERROR_RANDOM_FAILED);
    }
}

TEST(RandomTest, ScalarRejectsTrivialOrder) {
    FixedRandom random;
    EXPECT_THROW(random_scalar(random, ZZ(1)), std::invalid_argument);
}

TEST(RandomTest, KCalculatorRequiresInit) {
    RandomDSAKCalculator calc;
    EXPECT_FALSE(calc.is_deterministic());
    EXPECT_THROW(calc.next_k(), StateError);

    calc.init(ZZ(1000), std::make_shared<FixedRandom>("0005"));
    EXPECT_EQ(calc.next_k(), ZZ(5));
    EXPECT_THROW(calc.init(ZZ(1000), nullptr), std::invalid_argument);
}
