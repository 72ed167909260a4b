/**
 * @file sm2_signer.h
 * @brief SM2 digital signature (GB/T 32918.2-2016)
 *
 * Streaming signer/verifier. init() computes Z for the key and identity and
 * preloads it into the digest; update() hashes message bytes; the final
 * call (generate_signature / verify_signature) consumes the message and
 * returns the digest to the Z-preloaded state.
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#ifndef GMSM_CRYPTO_SM_SM2_SIGNER_H
#define GMSM_CRYPTO_SM_SM2_SIGNER_H

#include "gmsm/crypto/digest.h"
#include "gmsm/crypto/ecc/ec_params.h"
#include "gmsm/crypto/random.h"
#include "gmsm/crypto/signature_encoding.h"

#include <memory>
#include <optional>

namespace gmsm {
namespace sm2 {

class SM2Signer {
public:
    /**
     * Null arguments select the defaults: DER encoding, SM3 and a random
     * k calculator.
     */
    explicit SM2Signer(SignatureEncodingPtr encoding = nullptr,
                       DigestPtr digest = nullptr,
                       std::unique_ptr<DSAKCalculator> k_calculator = nullptr);

    SM2Signer(const SM2Signer&) = delete;
    SM2Signer& operator=(const SM2Signer&) = delete;

    /**
     * @param for_signing true needs a private key, false a public key
     * @param key Key parameters
     * @param user_id Distinguishing ID; DEFAULT_USER_ID when absent
     * @param random Randomness for k; SystemRandom when null
     *
     * @throws StateError if the key kind does not match for_signing
     * @throws std::invalid_argument if user_id is longer than 8191 bytes
     */
    void init(bool for_signing, const ecc::KeyParameters& key,
              const std::optional<ByteVec>& user_id = std::nullopt,
              RandomSourcePtr random = nullptr);

    /** @throws StateError before init() */
    void update(const uint8_t* data, size_t len);
    void update(const ByteVec& data) { update(data.data(), data.size()); }

    /**
     * @brief Sign everything passed to update() since the last reset
     *
     * @throws StateError if not initialized for signing
     * @throws InvalidKeyError if (1 + d) is not invertible mod n
     */
    ByteVec generate_signature();

    /**
     * @brief Check a signature over everything passed to update()
     *
     * Malformed or out-of-range signatures give false.
     *
     * @throws StateError if not initialized for verification
     */
    bool verify_signature(const uint8_t* sig, size_t sig_len);
    bool verify_signature(const ByteVec& sig) {
        return verify_signature(sig.data(), sig.size());
    }

    /** Drop buffered message bytes, keeping Z */
    void reset();

    bool is_initialized() const { return static_cast<bool>(domain_); }
    bool is_for_signing() const { return for_signing_; }

    /** Z of the bound key and identity */
    const ByteVec& z() const { return z_; }

private:
    void require_init(bool signing) const;
    ZZ calculate_e();

    SignatureEncodingPtr encoding_;
    DigestPtr digest_;
    DigestPtr z_state_;
    std::unique_ptr<DSAKCalculator> k_calculator_;

    ecc::DomainParametersPtr domain_;
    std::optional<ecc::ECPrivateKeyParameters> private_key_;
    std::optional<ecc::ECPublicKeyParameters> public_key_;
    bool for_signing_ = false;
    ByteVec z_;
};

} // namespace sm2
} // namespace gmsm

#endif // GMSM_CRYPTO_SM_SM2_SIGNER_H
