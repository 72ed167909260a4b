/**
 * @file test_ec_params.cpp
 * @brief Domain parameters, key parameters and key generation tests
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>
#include <memory>
#include <string>

#include "gmsm/core/errors.h"
#include "gmsm/crypto/ecc/ec_params.h"
#include "gmsm/utils/encoding.h"
#include "support/fixed_random.h"

using namespace gmsm;
using namespace gmsm::ecc;
using gmsm::test::FixedRandom;

static ZZ hex_to_zz(const std::string& hex) {
    ByteVec bytes = encoding::hexDecode(hex);
    return math::zz_from_bytes_be(bytes.data(), bytes.size());
}

static const char* const kPrivHex =
    "128B2FA8BD433C6C068C8D803DFF79792A519A55171B1B650C23661D15897263";
static const char* const kPubHex =
    "04"
    "D5548C7825CBB56150A3506CD57464AF8A1AE0519DFAF3C58221DC810CAF28DD"
    "921073768FE3D59CE54E79A49445CF73FED23086537027264D168946D479533E";

class ECParamsTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() { domain_ = make_sm2_domain(); }
    static void TearDownTestSuite() { domain_.reset(); }

    static DomainParametersPtr domain_;
};

DomainParametersPtr ECParamsTest::domain_;

// ============================================================================
// Domain Parameters
// ============================================================================

TEST_F(ECParamsTest, SM2DomainIsConsistent) {
    ASSERT_NE(domain_, nullptr);
    EXPECT_EQ(domain_->G(), domain_->curve().get_generator());
    EXPECT_EQ(domain_->n(), domain_->curve().get_order());
    EXPECT_EQ(domain_->h(), ZZ(1));
    EXPECT_TRUE(domain_->multiply_base(domain_->n()).is_infinity());
}

TEST_F(ECParamsTest, DomainsCompareStructurally) {
    DomainParametersPtr other = make_sm2_domain();
    EXPECT_NE(other.get(), domain_.get());
    EXPECT_TRUE(*other == *domain_);
}

TEST_F(ECParamsTest, DomainRejectsWrongOrder) {
    const ECCurvePtr& curve = domain_->curve_ptr();
    EXPECT_THROW(DomainParameters(curve, curve->get_generator(), domain_->n() + 1, ZZ(1)),
                 std::invalid_argument);
    EXPECT_THROW(DomainParameters(curve, curve->infinity(), domain_->n(), ZZ(1)),
                 std::invalid_argument);
    EXPECT_THROW(DomainParameters(curve, curve->get_generator(), ZZ(1), ZZ(1)),
                 std::invalid_argument);
}

TEST_F(ECParamsTest, BaseAndPointMultipliersAgree) {
    ZZ k = hex_to_zz(kPrivHex);
    EXPECT_EQ(domain_->multiply_base(k), domain_->multiply(domain_->G(), k));
}

// ============================================================================
// Private Keys
// ============================================================================

TEST_F(ECParamsTest, PrivateKeyRangeEnforced) {
    EXPECT_THROW(ECPrivateKeyParameters(domain_, ZZ(0)), InvalidKeyError);
    EXPECT_THROW(ECPrivateKeyParameters(domain_, domain_->n()), InvalidKeyError);
    EXPECT_THROW(ECPrivateKeyParameters(domain_, ZZ(-3)), InvalidKeyError);
    EXPECT_NO_THROW(ECPrivateKeyParameters(domain_, ZZ(1)));
    EXPECT_NO_THROW(ECPrivateKeyParameters(domain_, domain_->n() - 1));
}

TEST_F(ECParamsTest, PrivateKeyDerivesPublicPoint) {
    ECPrivateKeyParameters priv(domain_, hex_to_zz(kPrivHex));
    EXPECT_EQ(encoding::hexEncode(domain_->curve().encode_point(priv.public_point())),
              encoding::hexEncode(encoding::hexDecode(kPubHex)));
}

TEST_F(ECParamsTest, PrivateKeyEncodeDecode) {
    ByteVec raw = encoding::hexDecode(kPrivHex);
    ECPrivateKeyParameters priv = ECPrivateKeyParameters::decode(domain_, raw.data(), raw.size());
    EXPECT_EQ(priv.d(), hex_to_zz(kPrivHex));
    EXPECT_EQ(priv.encode(), raw);

    // Leading zero bytes survive
    ECPrivateKeyParameters small(domain_, ZZ(5));
    ByteVec enc = small.encode();
    ASSERT_EQ(enc.size(), 32u);
    EXPECT_EQ(enc[31], 5);
    EXPECT_EQ(enc[0], 0);
}

TEST_F(ECParamsTest, PrivateKeyDecodeRejectsBadInput) {
    ByteVec short_key(31, 0x11);
    EXPECT_THROW(ECPrivateKeyParameters::decode(domain_, short_key.data(), short_key.size()),
                 InvalidKeyError);

    ByteVec zero(32, 0x00);
    EXPECT_THROW(ECPrivateKeyParameters::decode(domain_, zero.data(), zero.size()),
                 InvalidKeyError);

    ByteVec too_big(32, 0xFF);
    EXPECT_THROW(ECPrivateKeyParameters::decode(domain_, too_big.data(), too_big.size()),
                 InvalidKeyError);
}

// ============================================================================
// Public Keys
// ============================================================================

TEST_F(ECParamsTest, PublicKeyDecodeUncompressedAndCompressed) {
    ByteVec raw = encoding::hexDecode(kPubHex);
    ECPublicKeyParameters pub = ECPublicKeyParameters::decode(domain_, raw.data(), raw.size());
    EXPECT_EQ(pub.encode(false), raw);

    ByteVec compressed = pub.encode(true);
    ASSERT_EQ(compressed.size(), 33u);
    ECPublicKeyParameters again =
        ECPublicKeyParameters::decode(domain_, compressed.data(), compressed.size());
    EXPECT_EQ(again.Q(), pub.Q());
}

TEST_F(ECParamsTest, PublicKeyRejectsInvalidPoints) {
    ByteVec raw = encoding::hexDecode(kPubHex);
    raw[64] ^= 0x01;
    EXPECT_THROW(ECPublicKeyParameters::decode(domain_, raw.data(), raw.size()),
                 InvalidKeyError);

    ByteVec infinity = {0x00};
    EXPECT_THROW(ECPublicKeyParameters::decode(domain_, infinity.data(), infinity.size()),
                 InvalidKeyError);

    EXPECT_THROW(ECPublicKeyParameters(domain_, domain_->curve().infinity()), InvalidKeyError);
}

TEST_F(ECParamsTest, ValidationHelpers) {
    EXPECT_TRUE(is_valid_private_scalar(*domain_, ZZ(1)));
    EXPECT_FALSE(is_valid_private_scalar(*domain_, ZZ(0)));
    EXPECT_FALSE(is_valid_private_scalar(*domain_, domain_->n()));

    EXPECT_TRUE(is_valid_public_point(*domain_, domain_->G()));
    EXPECT_FALSE(is_valid_public_point(*domain_, domain_->curve().infinity()));
}

TEST_F(ECParamsTest, KeyParameterVariantSelectsKind) {
    ECPrivateKeyParameters priv(domain_, ZZ(7));
    KeyParameters params = priv;
    EXPECT_TRUE(std::holds_alternative<ECPrivateKeyParameters>(params));

    params = ECPublicKeyParameters(domain_, priv.public_point());
    EXPECT_TRUE(std::holds_alternative<ECPublicKeyParameters>(params));
}

// ============================================================================
// Key Generation
// ============================================================================

TEST_F(ECParamsTest, GenerateKeyPairUsesRandomScalar) {
    FixedRandom random(kPrivHex);
    ECKeyPair kp = generate_key_pair(domain_, random);
    EXPECT_EQ(kp.private_key.d(), hex_to_zz(kPrivHex));
    EXPECT_EQ(kp.public_key.Q(), kp.private_key.public_point());
    EXPECT_EQ(random.remaining(), 0u);
}

TEST_F(ECParamsTest, GenerateKeyPairRejectsOrderMinusOne) {
    // n - 1 is outside [1, n-2]: first draw rejected, second accepted
    FixedRandom random;
    random.push(math::zz_to_bytes_be(domain_->n() - 1, 32));
    random.push_hex(kPrivHex);
    ECKeyPair kp = generate_key_pair(domain_, random);
    EXPECT_EQ(kp.private_key.d(), hex_to_zz(kPrivHex));
    EXPECT_EQ(random.calls(), 2u);
}

TEST_F(ECParamsTest, GenerateKeyPairWithSystemRandom) {
    SystemRandom random;
    ECKeyPair a = generate_key_pair(domain_, random);
    ECKeyPair b = generate_key_pair(domain_, random);
    EXPECT_NE(a.private_key.d(), b.private_key.d());
    EXPECT_TRUE(is_valid_public_point(*domain_, a.public_key.Q()));
}
