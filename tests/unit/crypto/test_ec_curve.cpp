/**
 * @file test_ec_curve.cpp
 * @brief Elliptic curve group law and point encoding unit tests
 *
 * Tests for:
 * - SM2 curve parameters and generator
 * - Affine and Jacobian addition, doubling, negation
 * - Point encoding (infinity, compressed, uncompressed) and decoding
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

#include "gmsm/core/errors.h"
#include "gmsm/crypto/ecc/ec_curve.h"
#include "gmsm/utils/encoding.h"

using namespace gmsm;
using namespace gmsm::ecc;

static ZZ hex_to_zz(const std::string& hex) {
    ByteVec bytes = encoding::hexDecode(hex);
    return math::zz_from_bytes_be(bytes.data(), bytes.size());
}

// ============================================================================
// ECCurve Test Fixture
// ============================================================================

class ECCurveTest : public ::testing::Test {
protected:
    void SetUp() override {
        curve_ = std::make_unique<ECCurve>(sm2_curve_params());
        G_ = curve_->get_generator();
    }

    AffinePoint point(const std::string& x_hex, const std::string& y_hex) const {
        return curve_->create_point(hex_to_zz(x_hex), hex_to_zz(y_hex));
    }

    std::unique_ptr<ECCurve> curve_;
    AffinePoint G_;
};

// 2G and 3G on sm2p256v1
static const char* const kTwoGx = "56CEFD60D7C87C000D58EF57FA73BA4D9C0DFA08C08A7331495C2E1DA3F2BD52";
static const char* const kTwoGy = "31B7E7E6CC8189F668535CE0F8EAF1BD6DE84C182F6C8E716F780D3A970A23C3";
static const char* const kThreeGx = "A97F7CD4B3C993B4BE2DAA8CDB41E24CA13F6BD945302244E26918F1D0509EBF";
static const char* const kThreeGy = "530B5DD88C688EF5CCC5CEC08A72150F7C400EE5CD045292AACDD037458F6E6";

// ============================================================================
// Curve Parameters
// ============================================================================

TEST_F(ECCurveTest, SM2Parameters) {
    EXPECT_EQ(curve_->get_name(), "sm2p256v1");
    EXPECT_EQ(curve_->field_size(), 256);
    EXPECT_EQ(curve_->coordinate_size(), 32u);
    EXPECT_EQ(curve_->get_cofactor(), ZZ(1));
    EXPECT_EQ(curve_->get_order(),
              hex_to_zz("FFFFFFFEFFFFFFFFFFFFFFFFFFFFFFFF7203DF6B21C6052B53BBF40939D54123"));
    EXPECT_EQ(curve_->encoded_point_size(false), 65u);
    EXPECT_EQ(curve_->encoded_point_size(true), 33u);
}

TEST_F(ECCurveTest, GeneratorCoordinates) {
    EXPECT_EQ(G_.x.value(),
              hex_to_zz("32C4AE2C1F1981195F9904466A39C9948FE30BBFF2660BE1715A4589334C74C7"));
    EXPECT_EQ(G_.y.value(),
              hex_to_zz("BC3736A2F4F6779C59BDCEE36B692153D0A9877CC62A474002DF32E52139F0A0"));
    EXPECT_TRUE(curve_->is_on_curve(G_));
    EXPECT_TRUE(curve_->validate_point(G_));
}

TEST_F(ECCurveTest, SingularCurveRejected) {
    CurveParams params = sm2_curve_params();
    params.a = 0;
    params.b = 0;
    EXPECT_THROW((void)ECCurve(params), MathDomainError);
}

TEST_F(ECCurveTest, NonPositiveOrderRejected) {
    CurveParams params = sm2_curve_params();
    params.n = 0;
    EXPECT_THROW((void)ECCurve(params), std::invalid_argument);
}

TEST_F(ECCurveTest, GeneratorOffCurveRejected) {
    CurveParams params = sm2_curve_params();
    params.Gy += 1;
    EXPECT_THROW((void)ECCurve(params), InvalidPointError);
}

// ============================================================================
// Point Construction
// ============================================================================

TEST_F(ECCurveTest, CreatePointValidatesMembership) {
    EXPECT_THROW(curve_->create_point(G_.x.value(), G_.y.value() + 1), InvalidPointError);
    EXPECT_THROW(curve_->create_point(curve_->get_prime(), G_.y.value()), InvalidPointError);

    // The unchecked path skips the test; is_on_curve still catches it
    AffinePoint bad = curve_->create_point_unchecked(G_.x.value(), G_.y.value() + 1);
    EXPECT_FALSE(curve_->is_on_curve(bad));
    EXPECT_FALSE(curve_->validate_point(bad));
}

TEST_F(ECCurveTest, InfinityIsNotAValidPublicPoint) {
    EXPECT_TRUE(curve_->infinity().is_infinity());
    EXPECT_TRUE(curve_->is_on_curve(curve_->infinity()));
    EXPECT_FALSE(curve_->validate_point(curve_->infinity()));
}

// ============================================================================
// Group Law (affine)
// ============================================================================

TEST_F(ECCurveTest, DoubleGenerator) {
    AffinePoint twoG = curve_->double_point(G_);
    EXPECT_EQ(twoG, point(kTwoGx, kTwoGy));
    EXPECT_EQ(curve_->add(G_, G_), twoG) << "add(P, P) must fall through to doubling";
}

TEST_F(ECCurveTest, AddDistinctPoints) {
    AffinePoint twoG = point(kTwoGx, kTwoGy);
    EXPECT_EQ(curve_->add(G_, twoG), point(kThreeGx, kThreeGy));
    EXPECT_EQ(curve_->add(twoG, G_), point(kThreeGx, kThreeGy));
}

TEST_F(ECCurveTest, InfinityIsIdentity) {
    AffinePoint O = curve_->infinity();
    EXPECT_EQ(curve_->add(O, G_), G_);
    EXPECT_EQ(curve_->add(G_, O), G_);
    EXPECT_TRUE(curve_->add(O, O).is_infinity());
    EXPECT_TRUE(curve_->double_point(O).is_infinity());
}

TEST_F(ECCurveTest, NegateAndSubtract) {
    AffinePoint negG = curve_->negate(G_);
    EXPECT_EQ(negG.x, G_.x);
    EXPECT_EQ(negG.y, -G_.y);
    EXPECT_TRUE(curve_->is_on_curve(negG));

    EXPECT_TRUE(curve_->add(G_, negG).is_infinity());
    EXPECT_TRUE(curve_->subtract(G_, G_).is_infinity());
    EXPECT_EQ(curve_->subtract(point(kThreeGx, kThreeGy), G_), point(kTwoGx, kTwoGy));
    EXPECT_TRUE(curve_->negate(curve_->infinity()).is_infinity());
}

// ============================================================================
// Group Law (Jacobian)
// ============================================================================

TEST_F(ECCurveTest, JacobianMatchesAffine) {
    JacobianPoint J = curve_->to_jacobian(G_);
    JacobianPoint J2 = curve_->double_point(J);
    JacobianPoint J3 = curve_->add(J2, J);

    EXPECT_EQ(curve_->normalize(J2), point(kTwoGx, kTwoGy));
    EXPECT_EQ(curve_->normalize(J3), point(kThreeGx, kThreeGy));
    EXPECT_EQ(curve_->normalize(curve_->add(J, J)), point(kTwoGx, kTwoGy));
}

TEST_F(ECCurveTest, JacobianEqualityIgnoresScaling) {
    JacobianPoint J = curve_->to_jacobian(G_);
    // (X*Z^2 : Y*Z^3 : Z) with Z = 7 is the same point
    const ZZ& p = curve_->get_prime();
    ZZ z(7);
    ZZ z2 = NTL::MulMod(z, z, p);
    ZZ z3 = NTL::MulMod(z2, z, p);
    JacobianPoint scaled(NTL::MulMod(J.X, z2, p), NTL::MulMod(J.Y, z3, p), z);

    EXPECT_TRUE(curve_->equals(J, scaled));
    EXPECT_EQ(curve_->normalize(scaled), G_);
    EXPECT_FALSE(curve_->equals(J, curve_->double_point(J)));
}

TEST_F(ECCurveTest, JacobianInfinity) {
    JacobianPoint O;
    EXPECT_TRUE(O.is_infinity());
    EXPECT_TRUE(curve_->normalize(O).is_infinity());

    JacobianPoint J = curve_->to_jacobian(G_);
    EXPECT_TRUE(curve_->add(J, curve_->negate(J)).is_infinity());
    EXPECT_TRUE(curve_->equals(curve_->add(O, J), J));
}

// ============================================================================
// Encoding
// ============================================================================

TEST_F(ECCurveTest, EncodeUncompressed) {
    ByteVec enc = curve_->encode_point(G_, false);
    ASSERT_EQ(enc.size(), 65u);
    EXPECT_EQ(encoding::hexEncode(enc),
              "04"
              "32c4ae2c1f1981195f9904466a39c9948fe30bbff2660be1715a4589334c74c7"
              "bc3736a2f4f6779c59bdcee36b692153d0a9877cc62a474002df32e52139f0a0");
    EXPECT_EQ(curve_->decode_point(enc), G_);
}

TEST_F(ECCurveTest, EncodeCompressedUsesParityOfY) {
    ByteVec enc = curve_->encode_point(G_, true);
    ASSERT_EQ(enc.size(), 33u);
    EXPECT_EQ(enc[0], G_.y.is_odd() ? 0x03 : 0x02);
    EXPECT_EQ(curve_->decode_point(enc), G_);

    AffinePoint negG = curve_->negate(G_);
    ByteVec neg_enc = curve_->encode_point(negG, true);
    EXPECT_NE(neg_enc[0], enc[0]);
    EXPECT_EQ(curve_->decode_point(neg_enc), negG);
}

TEST_F(ECCurveTest, EncodeInfinity) {
    ByteVec enc = curve_->encode_point(curve_->infinity());
    EXPECT_EQ(enc, ByteVec{0x00});
    EXPECT_TRUE(curve_->decode_point(enc).is_infinity());
}

TEST_F(ECCurveTest, DecodeRejectsMalformedInput) {
    ByteVec enc = curve_->encode_point(G_, false);

    EXPECT_THROW(curve_->decode_point(ByteVec()), InvalidPointError);

    ByteVec truncated(enc.begin(), enc.end() - 1);
    EXPECT_THROW(curve_->decode_point(truncated), InvalidPointError);

    ByteVec bad_prefix = enc;
    bad_prefix[0] = 0x05;
    EXPECT_THROW(curve_->decode_point(bad_prefix), InvalidPointError);

    ByteVec off_curve = enc;
    off_curve[64] ^= 0x01;
    EXPECT_THROW(curve_->decode_point(off_curve), InvalidPointError);

    ByteVec long_infinity = {0x00, 0x00};
    EXPECT_THROW(curve_->decode_point(long_infinity), InvalidPointError);

    // x = p is out of range
    ByteVec big_x = encoding::hexDecode(
        "02FFFFFFFEFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFF00000000FFFFFFFFFFFFFFFF");
    EXPECT_THROW(curve_->decode_point(big_x), InvalidPointError);
}

TEST_F(ECCurveTest, CurvesCompareStructurally) {
    ECCurve other(sm2_curve_params());
    EXPECT_TRUE(*curve_ == other);

    CurveParams params = sm2_curve_params();
    params.b += 1;
    // Different b moves G off the curve, so compare only through a valid curve
    EXPECT_THROW((void)ECCurve(params), InvalidPointError);
}
