/**
 * @file test_ec_multiplier.cpp
 * @brief Scalar multiplication strategy unit tests
 *
 * Simple double-and-add and the fixed-base comb must agree on every
 * scalar; both are checked against known multiples of G.
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

#include "gmsm/crypto/ecc/ec_multiplier.h"
#include "gmsm/utils/encoding.h"

using namespace gmsm;
using namespace gmsm::ecc;

static ZZ hex_to_zz(const std::string& hex) {
    ByteVec bytes = encoding::hexDecode(hex);
    return math::zz_from_bytes_be(bytes.data(), bytes.size());
}

class ECMultiplierTest : public ::testing::Test {
protected:
    void SetUp() override {
        curve_ = std::make_shared<const ECCurve>(sm2_curve_params());
        G_ = curve_->get_generator();
        n_ = curve_->get_order();
        simple_ = std::make_unique<SimpleECMultiplier>(curve_);
        comb_ = std::make_unique<FixedPointCombMultiplier>(curve_, G_);
    }

    ECCurvePtr curve_;
    AffinePoint G_;
    ZZ n_;
    std::unique_ptr<SimpleECMultiplier> simple_;
    std::unique_ptr<FixedPointCombMultiplier> comb_;
};

// ============================================================================
// Edge scalars
// ============================================================================

TEST_F(ECMultiplierTest, MultiplyByZeroIsInfinity) {
    EXPECT_TRUE(simple_->multiply(G_, ZZ(0)).is_infinity());
    EXPECT_TRUE(comb_->multiply(G_, ZZ(0)).is_infinity());
}

TEST_F(ECMultiplierTest, MultiplyByOneIsIdentity) {
    EXPECT_EQ(simple_->multiply(G_, ZZ(1)), G_);
    EXPECT_EQ(comb_->multiply(G_, ZZ(1)), G_);
}

TEST_F(ECMultiplierTest, MultiplyByOrderIsInfinity) {
    EXPECT_TRUE(simple_->multiply(G_, n_).is_infinity());
    EXPECT_TRUE(comb_->multiply(G_, n_).is_infinity());
}

TEST_F(ECMultiplierTest, MultiplyByOrderMinusOneIsNegation) {
    AffinePoint negG = curve_->negate(G_);
    EXPECT_EQ(simple_->multiply(G_, n_ - 1), negG);
    EXPECT_EQ(comb_->multiply(G_, n_ - 1), negG);
}

TEST_F(ECMultiplierTest, InfinityTimesAnythingIsInfinity) {
    EXPECT_TRUE(simple_->multiply(curve_->infinity(), ZZ(12345)).is_infinity());
}

TEST_F(ECMultiplierTest, NegativeScalarRejected) {
    EXPECT_THROW(simple_->multiply(G_, ZZ(-1)), std::invalid_argument);
    EXPECT_THROW(comb_->multiply(G_, ZZ(-5)), std::invalid_argument);
    EXPECT_THROW(multiply_double_and_add(*curve_, curve_->to_jacobian(G_), ZZ(-1)),
                 std::invalid_argument);
}

// ============================================================================
// Known multiples
// ============================================================================

TEST_F(ECMultiplierTest, KnownMultiples) {
    AffinePoint twoG = curve_->create_point(
        hex_to_zz("56CEFD60D7C87C000D58EF57FA73BA4D9C0DFA08C08A7331495C2E1DA3F2BD52"),
        hex_to_zz("31B7E7E6CC8189F668535CE0F8EAF1BD6DE84C182F6C8E716F780D3A970A23C3"));
    EXPECT_EQ(simple_->multiply(G_, ZZ(2)), twoG);
    EXPECT_EQ(comb_->multiply(G_, ZZ(2)), twoG);

    // GM/T 0003.5 signing key d = 3945208F...
    ZZ d = hex_to_zz("3945208F7B2144B13F36E38AC6D39F95889393692860B51A42FB81EF4DF7C5B8");
    AffinePoint Q = curve_->create_point(
        hex_to_zz("09F9DF311E5421A150DD7D161E4BC5C672179FAD1833FC076BB08FF356F35020"),
        hex_to_zz("CCEA490CE26775A52DC6EA718CC1AA600AED05FBF35E084A6632F6072DA9AD13"));
    EXPECT_EQ(simple_->multiply(G_, d), Q);
    EXPECT_EQ(comb_->multiply(G_, d), Q);
}

// ============================================================================
// Simple vs Comb agreement
// ============================================================================

TEST_F(ECMultiplierTest, SimpleAndCombAgree) {
    std::vector<ZZ> scalars = {
        ZZ(3), ZZ(7), ZZ(31), ZZ(32), ZZ(33), ZZ(255), ZZ(256), ZZ(65537),
        NTL::power2_ZZ(128), NTL::power2_ZZ(255) - 1, n_ - 2,
        hex_to_zz("128B2FA8BD433C6C068C8D803DFF79792A519A55171B1B650C23661D15897263"),
        hex_to_zz("59276E27D506861A16680F3AD9C02DCCEF3CC1FA3CDBE4CE6D54B80DEAC1BC21"),
    };
    for (const ZZ& k : scalars) {
        EXPECT_EQ(simple_->multiply(G_, k), comb_->multiply(G_, k)) << "k = " << k;
    }
}

TEST_F(ECMultiplierTest, AllCombWidthsAgree) {
    ZZ k = hex_to_zz("128B2FA8BD433C6C068C8D803DFF79792A519A55171B1B650C23661D15897263");
    AffinePoint expected = simple_->multiply(G_, k);
    for (long w = 2; w <= 8; ++w) {
        FixedPointCombMultiplier comb(curve_, G_, w);
        EXPECT_EQ(comb.width(), w);
        EXPECT_EQ(comb.multiply(G_, k), expected) << "width = " << w;
        EXPECT_TRUE(comb.multiply(G_, n_).is_infinity()) << "width = " << w;
    }
}

TEST_F(ECMultiplierTest, CombDefaultsFollowOrderSize) {
    EXPECT_EQ(comb_->comb_size(), 256);
    EXPECT_GE(comb_->width(), 2);
    EXPECT_LE(comb_->width(), 8);
    EXPECT_EQ(comb_->base(), G_);
}

// ============================================================================
// Comb restrictions
// ============================================================================

TEST_F(ECMultiplierTest, CombRejectsOtherPoints) {
    AffinePoint twoG = curve_->double_point(G_);
    EXPECT_THROW(comb_->multiply(twoG, ZZ(5)), std::invalid_argument);
}

TEST_F(ECMultiplierTest, CombRejectsOversizedScalar) {
    EXPECT_THROW(comb_->multiply(G_, NTL::power2_ZZ(256)), std::invalid_argument);
}

TEST_F(ECMultiplierTest, CombRejectsBadConstruction) {
    EXPECT_THROW(FixedPointCombMultiplier(curve_, curve_->infinity()), std::invalid_argument);
    EXPECT_THROW(FixedPointCombMultiplier(curve_, G_, 1), std::invalid_argument);
    EXPECT_THROW(FixedPointCombMultiplier(curve_, G_, 9), std::invalid_argument);
}

// ============================================================================
// Shamir's trick
// ============================================================================

TEST_F(ECMultiplierTest, SumOfTwoMultipliesMatchesSeparateProducts) {
    AffinePoint Q = simple_->multiply(G_, ZZ(987654321));
    ZZ a = hex_to_zz("59276E27D506861A16680F3AD9C02DCCEF3CC1FA3CDBE4CE6D54B80DEAC1BC21");
    ZZ b = hex_to_zz("0123456789ABCDEF0123456789ABCDEF");

    AffinePoint expected = curve_->add(simple_->multiply(G_, a), simple_->multiply(Q, b));
    EXPECT_EQ(sum_of_two_multiplies(*curve_, G_, a, Q, b), expected);
}

TEST_F(ECMultiplierTest, SumOfTwoMultipliesEdgeCases) {
    AffinePoint Q = curve_->double_point(G_);
    EXPECT_TRUE(sum_of_two_multiplies(*curve_, G_, ZZ(0), Q, ZZ(0)).is_infinity());
    EXPECT_EQ(sum_of_two_multiplies(*curve_, G_, ZZ(0), Q, ZZ(1)), Q);
    // [2]G + [n-1]2G = O
    EXPECT_TRUE(sum_of_two_multiplies(*curve_, G_, ZZ(2), Q, n_ - 1).is_infinity());
    EXPECT_THROW(sum_of_two_multiplies(*curve_, G_, ZZ(-1), Q, ZZ(1)), std::invalid_argument);
}
