/**
 * @file sm2_engine.h
 * @brief SM2 public key encryption (GB/T 32918.4-2016)
 *
 * Ciphertext layout:
 * - C1C2C3: C1 (65 bytes) || C2 (len(M)) || C3 (32 bytes)
 * - C1C3C2: C1 || C3 || C2
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#ifndef GMSM_CRYPTO_SM_SM2_ENGINE_H
#define GMSM_CRYPTO_SM_SM2_ENGINE_H

#include "gmsm/crypto/digest.h"
#include "gmsm/crypto/ecc/ec_params.h"
#include "gmsm/crypto/random.h"

#include <optional>

namespace gmsm {
namespace sm2 {

enum class SM2Mode {
    C1C2C3,
    C1C3C2
};

class SM2Engine {
public:
    /** Null digest selects SM3 */
    explicit SM2Engine(SM2Mode mode = SM2Mode::C1C2C3, DigestPtr digest = nullptr);

    SM2Engine(const SM2Engine&) = delete;
    SM2Engine& operator=(const SM2Engine&) = delete;

    /**
     * @param for_encryption true needs a public key, false a private key
     * @param random Randomness for k; SystemRandom when null
     *
     * @throws StateError if the key kind does not match for_encryption
     * @throws InvalidKeyError if [h]Q is infinity
     */
    void init(bool for_encryption, const ecc::KeyParameters& key,
              RandomSourcePtr random = nullptr);

    /**
     * @brief Encrypt or decrypt one message, depending on init()
     *
     * @throws StateError before init()
     * @throws InputTooShortError on empty plaintext or truncated ciphertext
     * @throws InvalidPointError if C1 does not decode to a valid point
     * @throws AuthenticationFailure if C3 does not match
     */
    ByteVec process_block(const uint8_t* in, size_t in_len);
    ByteVec process_block(const ByteVec& in) { return process_block(in.data(), in.size()); }

    /** Ciphertext length for a plaintext of input_len bytes */
    size_t get_output_size(size_t input_len) const;

    SM2Mode mode() const { return mode_; }

private:
    ByteVec encrypt(const uint8_t* in, size_t in_len);
    ByteVec decrypt(const uint8_t* in, size_t in_len);

    /** t = KDF(x2 || y2, len) */
    void derive_keystream(const ecc::AffinePoint& P, uint8_t* out, size_t len);

    /** C3 = H(x2 || M || y2) */
    ByteVec compute_c3(const ecc::AffinePoint& P, const uint8_t* msg, size_t len);

    SM2Mode mode_;
    DigestPtr digest_;

    bool for_encryption_ = false;
    ecc::DomainParametersPtr domain_;
    std::optional<ecc::ECPrivateKeyParameters> private_key_;
    std::optional<ecc::ECPublicKeyParameters> public_key_;
    RandomSourcePtr random_;
};

} // namespace sm2
} // namespace gmsm

#endif // GMSM_CRYPTO_SM_SM2_ENGINE_H
