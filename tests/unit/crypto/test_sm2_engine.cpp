/**
 * @file test_sm2_engine.cpp
 * @brief SM2 public key encryption tests (GB/T 32918.4)
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <utility>

#include "gmsm/core/errors.h"
#include "gmsm/crypto/sm/sm2_engine.h"
#include "gmsm/utils/encoding.h"
#include "support/fixed_random.h"

using namespace gmsm;
using namespace gmsm::sm2;
using gmsm::test::FixedRandom;

static ZZ hex_to_zz(const std::string& hex) {
    ByteVec bytes = encoding::hexDecode(hex);
    return math::zz_from_bytes_be(bytes.data(), bytes.size());
}

static ByteVec bytes(const std::string& s) { return ByteVec(s.begin(), s.end()); }

static const char* const kStdPriv =
    "3945208F7B2144B13F36E38AC6D39F95889393692860B51A42FB81EF4DF7C5B8";
static const char* const kStdK =
    "59276E27D506861A16680F3AD9C02DCCEF3CC1FA3CDBE4CE6D54B80DEAC1BC21";

// "encryption standard" under kStdPriv with k = kStdK
static const char* const kC1C2C3 =
    "04"
    "04ebfc718e8d1798620432268e77feb6415e2ede0e073c0f4f640ecd2e149a73"
    "e858f9d81e5430a57b36daab8f950a3c64e6ee6a63094d99283aff767e124df0"
    "21886ca989ca9c7d58087307ca93092d651efa"
    "59983c18f809e262923c53aec295d30383b54e39d609d160afcb1908d0bd8766";
static const char* const kC1C3C2 =
    "04"
    "04ebfc718e8d1798620432268e77feb6415e2ede0e073c0f4f640ecd2e149a73"
    "e858f9d81e5430a57b36daab8f950a3c64e6ee6a63094d99283aff767e124df0"
    "59983c18f809e262923c53aec295d30383b54e39d609d160afcb1908d0bd8766"
    "21886ca989ca9c7d58087307ca93092d651efa";

class SM2EngineTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() { domain_ = ecc::make_sm2_domain(); }
    static void TearDownTestSuite() { domain_.reset(); }

    static ecc::ECPrivateKeyParameters priv() {
        return ecc::ECPrivateKeyParameters(domain_, hex_to_zz(kStdPriv));
    }

    static ecc::ECPublicKeyParameters pub() {
        return ecc::ECPublicKeyParameters(domain_, priv().public_point());
    }

    static ByteVec encrypt(SM2Mode mode, const ByteVec& msg, RandomSourcePtr random = nullptr) {
        SM2Engine engine(mode);
        engine.init(true, pub(), std::move(random));
        return engine.process_block(msg);
    }

    static ByteVec decrypt(SM2Mode mode, const ByteVec& ct) {
        SM2Engine engine(mode);
        engine.init(false, priv());
        return engine.process_block(ct);
    }

    static ecc::DomainParametersPtr domain_;
};

ecc::DomainParametersPtr SM2EngineTest::domain_;

// ============================================================================
// Known Answer Tests
// ============================================================================

TEST_F(SM2EngineTest, StandardVectorC1C2C3) {
    auto random = std::make_shared<FixedRandom>(kStdK);
    ByteVec ct = encrypt(SM2Mode::C1C2C3, bytes("encryption standard"), random);
    EXPECT_EQ(encoding::hexEncode(ct), kC1C2C3);
    EXPECT_EQ(random->remaining(), 0u);

    EXPECT_EQ(decrypt(SM2Mode::C1C2C3, encoding::hexDecode(kC1C2C3)),
              bytes("encryption standard"));
}

TEST_F(SM2EngineTest, StandardVectorC1C3C2) {
    auto random = std::make_shared<FixedRandom>(kStdK);
    ByteVec ct = encrypt(SM2Mode::C1C3C2, bytes("encryption standard"), random);
    EXPECT_EQ(encoding::hexEncode(ct), kC1C3C2);

    EXPECT_EQ(decrypt(SM2Mode::C1C3C2, encoding::hexDecode(kC1C3C2)),
              bytes("encryption standard"));
}

/**
 * @brief A scalar of 0 is redrawn before any point is computed
 */
TEST_F(SM2EngineTest, ZeroScalarIsRedrawn) {
    auto random = std::make_shared<FixedRandom>();
    random->push(ByteVec(32, 0x00));
    random->push_hex(kStdK);
    ByteVec ct = encrypt(SM2Mode::C1C2C3, bytes("encryption standard"), random);
    EXPECT_EQ(encoding::hexEncode(ct), kC1C2C3);
    EXPECT_EQ(random->calls(), 2u);
}

// ============================================================================
// Round Trips
// ============================================================================

TEST_F(SM2EngineTest, RoundTripBothModes) {
    for (SM2Mode mode : {SM2Mode::C1C2C3, SM2Mode::C1C3C2}) {
        for (size_t len : {1u, 16u, 31u, 32u, 33u, 64u, 1000u}) {
            ByteVec msg(len);
            for (size_t i = 0; i < len; ++i) {
                msg[i] = static_cast<uint8_t>(i * 7 + 3);
            }
            ByteVec ct = encrypt(mode, msg);
            EXPECT_EQ(ct.size(), 97 + len);
            EXPECT_EQ(ct[0], 0x04);
            EXPECT_EQ(decrypt(mode, ct), msg) << "len " << len;
        }
    }
}

TEST_F(SM2EngineTest, CiphertextsAreRandomized) {
    ByteVec a = encrypt(SM2Mode::C1C2C3, bytes("same"));
    ByteVec b = encrypt(SM2Mode::C1C2C3, bytes("same"));
    EXPECT_NE(a, b);
}

TEST_F(SM2EngineTest, OutputSize) {
    SM2Engine engine;
    EXPECT_EQ(engine.get_output_size(19), 116u);
    engine.init(true, pub());
    EXPECT_EQ(engine.get_output_size(0), 97u);
    EXPECT_EQ(engine.get_output_size(100), 197u);
    EXPECT_EQ(engine.mode(), SM2Mode::C1C2C3);
}

// ============================================================================
// Decryption Failures
// ============================================================================

TEST_F(SM2EngineTest, TamperedCiphertextRejected) {
    const std::pair<SM2Mode, const char*> vectors[] = {
        {SM2Mode::C1C2C3, kC1C2C3},
        {SM2Mode::C1C3C2, kC1C3C2},
    };
    for (const auto& v : vectors) {
        ByteVec good = encoding::hexDecode(v.second);
        for (size_t i = 0; i < good.size(); ++i) {
            ByteVec bad = good;
            bad[i] ^= 0x01;
            EXPECT_THROW(decrypt(v.first, bad), CryptoError) << "mode " << static_cast<int>(v.first) << " byte " << i;
        }
    }

    ByteVec ct = encoding::hexDecode(kC1C2C3);

    // Any change past C1 reaches the C3 check
    ByteVec bad_c2 = ct;
    bad_c2[70] ^= 0xFF;
    EXPECT_THROW(decrypt(SM2Mode::C1C2C3, bad_c2), AuthenticationFailure);
    ByteVec bad_c3 = ct;
    bad_c3.back() ^= 0xFF;
    EXPECT_THROW(decrypt(SM2Mode::C1C2C3, bad_c3), AuthenticationFailure);
}

TEST_F(SM2EngineTest, WrongModeRejected) {
    EXPECT_THROW(decrypt(SM2Mode::C1C3C2, encoding::hexDecode(kC1C2C3)), AuthenticationFailure);
    EXPECT_THROW(decrypt(SM2Mode::C1C2C3, encoding::hexDecode(kC1C3C2)), AuthenticationFailure);
}

TEST_F(SM2EngineTest, WrongKeyRejected) {
    ByteVec ct = encrypt(SM2Mode::C1C2C3, bytes("secret"));
    SM2Engine engine;
    engine.init(false, ecc::ECPrivateKeyParameters(domain_, hex_to_zz("1234")));
    EXPECT_THROW(engine.process_block(ct), AuthenticationFailure);
}

TEST_F(SM2EngineTest, ShortCiphertextRejected) {
    EXPECT_THROW(decrypt(SM2Mode::C1C2C3, ByteVec()), InputTooShortError);
    ByteVec ct = encoding::hexDecode(kC1C2C3);
    ByteVec truncated(ct.begin(), ct.begin() + 97);
    EXPECT_THROW(decrypt(SM2Mode::C1C2C3, truncated), InputTooShortError);
}

TEST_F(SM2EngineTest, CompressedC1Rejected) {
    ByteVec ct = encoding::hexDecode(kC1C2C3);
    ct[0] = 0x02;
    EXPECT_THROW(decrypt(SM2Mode::C1C2C3, ct), InvalidPointError);
}

TEST_F(SM2EngineTest, OffCurveC1Rejected) {
    ByteVec ct = encoding::hexDecode(kC1C2C3);
    ct[64] ^= 0x01;  // last byte of x1
    EXPECT_THROW(decrypt(SM2Mode::C1C2C3, ct), InvalidPointError);
}

// ============================================================================
// Error Handling
// ============================================================================

TEST_F(SM2EngineTest, EmptyPlaintextRejected) {
    EXPECT_THROW(encrypt(SM2Mode::C1C2C3, ByteVec()), InputTooShortError);
}

TEST_F(SM2EngineTest, UseBeforeInit) {
    SM2Engine engine;
    EXPECT_THROW(engine.process_block(bytes("abc")), StateError);
}

TEST_F(SM2EngineTest, WrongKeyKind) {
    SM2Engine engine;
    EXPECT_THROW(engine.init(true, priv()), StateError);
    EXPECT_THROW(engine.init(false, pub()), StateError);
}

TEST_F(SM2EngineTest, ExhaustedRandomPropagates) {
    auto random = std::make_shared<FixedRandom>();
    EXPECT_THROW(encrypt(SM2Mode::C1C2C3, bytes("abc"), random), CryptoError);
}
