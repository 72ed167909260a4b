/**
 * @file sm2.h
 * @brief SM2 high-level C++ API and C ABI
 *
 * The C ABI works on an opaque context that owns the SM2 domain (curve and
 * comb table) and a random source. Keys cross the boundary as bytes:
 * - private key: 32-byte big-endian d
 * - public key: 65-byte uncompressed point (04 || x || y); the decoders
 *   also accept the 33-byte compressed form
 * - signature: DER SEQUENCE { r, s }
 *
 * Output buffers follow one convention: pass a null output pointer to
 * receive the required size in *out_len.
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#ifndef GMSM_CRYPTO_SM_SM2_H
#define GMSM_CRYPTO_SM_SM2_H

#include "gmsm/core/common.h"

// ============================================================================
// C API
// ============================================================================

#ifdef __cplusplus
extern "C" {
#endif

typedef struct gmsm_sm2_ctx gmsm_sm2_ctx_t;

typedef enum {
    GMSM_SM2_MODE_C1C2C3 = 0,
    GMSM_SM2_MODE_C1C3C2 = 1
} gmsm_sm2_mode_t;

typedef struct {
    uint8_t private_key[GMSM_SM2_PRIVATE_KEY_SIZE];
    uint8_t public_key[GMSM_SM2_PUBLIC_KEY_SIZE];
} gmsm_sm2_keypair_t;

/**
 * @brief Create a context (builds the domain and its comb table)
 * @return Context, or NULL on allocation failure
 */
GMSM_API gmsm_sm2_ctx_t* gmsm_sm2_ctx_new(void);

GMSM_API void gmsm_sm2_ctx_free(gmsm_sm2_ctx_t* ctx);

GMSM_API gmsm_error_t gmsm_sm2_generate_keypair(gmsm_sm2_ctx_t* ctx,
                                                gmsm_sm2_keypair_t* keypair);

/**
 * @brief Sign a message
 *
 * user_id NULL selects the default ID "1234567812345678".
 *
 * @param signature Output (DER), or NULL to query the maximum size
 * @param signature_len In: buffer size. Out: bytes written
 */
GMSM_API gmsm_error_t gmsm_sm2_sign(gmsm_sm2_ctx_t* ctx,
                                    const uint8_t private_key[GMSM_SM2_PRIVATE_KEY_SIZE],
                                    const uint8_t* user_id, size_t user_id_len,
                                    const uint8_t* message, size_t message_len,
                                    uint8_t* signature, size_t* signature_len);

/**
 * @return GMSM_SUCCESS if valid, GMSM_ERROR_VERIFICATION_FAILED if not
 */
GMSM_API gmsm_error_t gmsm_sm2_verify(gmsm_sm2_ctx_t* ctx,
                                      const uint8_t* public_key, size_t public_key_len,
                                      const uint8_t* user_id, size_t user_id_len,
                                      const uint8_t* message, size_t message_len,
                                      const uint8_t* signature, size_t signature_len);

GMSM_API gmsm_error_t gmsm_sm2_encrypt(gmsm_sm2_ctx_t* ctx, gmsm_sm2_mode_t mode,
                                       const uint8_t* public_key, size_t public_key_len,
                                       const uint8_t* plaintext, size_t plaintext_len,
                                       uint8_t* ciphertext, size_t* ciphertext_len);

/**
 * @return GMSM_ERROR_AUTH_FAILED if C3 does not match; nothing is written
 */
GMSM_API gmsm_error_t gmsm_sm2_decrypt(gmsm_sm2_ctx_t* ctx, gmsm_sm2_mode_t mode,
                                       const uint8_t private_key[GMSM_SM2_PRIVATE_KEY_SIZE],
                                       const uint8_t* ciphertext, size_t ciphertext_len,
                                       uint8_t* plaintext, size_t* plaintext_len);

/**
 * @brief Sign/verify and encrypt/decrypt round trips with a fixed key
 */
GMSM_API gmsm_error_t gmsm_sm2_self_test(void);

#ifdef __cplusplus
}
#endif

// ============================================================================
// C++ API
// ============================================================================

#ifdef __cplusplus

#include "gmsm/crypto/ecc/ec_params.h"
#include "gmsm/crypto/random.h"
#include "gmsm/crypto/sm/sm2_engine.h"

#include <optional>
#include <string>

namespace gmsm {
namespace sm2 {

/**
 * @brief One-shot SM2 operations bound to a domain
 */
class SM2 {
public:
    /** Null arguments select make_sm2_domain() and SystemRandom */
    explicit SM2(ecc::DomainParametersPtr domain = nullptr, RandomSourcePtr random = nullptr);

    const ecc::DomainParametersPtr& domain() const { return domain_; }

    ecc::ECKeyPair generate_keypair() const;

    ecc::ECPrivateKeyParameters private_key(const ByteVec& encoded) const;
    ecc::ECPublicKeyParameters public_key(const ByteVec& encoded) const;

    /** DER signature; user_id defaults to DEFAULT_USER_ID */
    ByteVec sign(const ecc::ECPrivateKeyParameters& key, const ByteVec& message,
                 const std::optional<ByteVec>& user_id = std::nullopt) const;

    bool verify(const ecc::ECPublicKeyParameters& key, const ByteVec& message,
                const ByteVec& signature,
                const std::optional<ByteVec>& user_id = std::nullopt) const;

    ByteVec encrypt(const ecc::ECPublicKeyParameters& key, const ByteVec& plaintext,
                    SM2Mode mode = SM2Mode::C1C2C3) const;

    ByteVec decrypt(const ecc::ECPrivateKeyParameters& key, const ByteVec& ciphertext,
                    SM2Mode mode = SM2Mode::C1C2C3) const;

private:
    ecc::DomainParametersPtr domain_;
    RandomSourcePtr random_;
};

} // namespace sm2
} // namespace gmsm

#endif // __cplusplus

#endif // GMSM_CRYPTO_SM_SM2_H
