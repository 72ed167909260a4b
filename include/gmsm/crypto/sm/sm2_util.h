/**
 * @file sm2_util.h
 * @brief Building blocks shared by the SM2 protocols: Z-value and KDF
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#ifndef GMSM_CRYPTO_SM_SM2_UTIL_H
#define GMSM_CRYPTO_SM_SM2_UTIL_H

#include "gmsm/crypto/digest.h"
#include "gmsm/crypto/ecc/ec_params.h"

#include <string>

namespace gmsm {
namespace sm2 {

/** Default distinguishing identifier, GM/T 0009 */
extern const char* const DEFAULT_USER_ID;

ByteVec default_user_id();

/** Longest ID whose bit length still fits the 16-bit ENTL field */
constexpr size_t MAX_USER_ID_LENGTH = 8191;

/**
 * @brief Feed a field element to the digest as fixed-width big-endian
 */
void add_field_element(Digest& digest, const math::FieldElement& value);

/**
 * @brief Z = H(ENTL || ID || a || b || Gx || Gy || Qx || Qy)
 *
 * ENTL is the bit length of ID as two big-endian bytes. digest is reset
 * before and after use.
 *
 * @throws std::invalid_argument if user_id exceeds MAX_USER_ID_LENGTH
 */
ByteVec compute_z(Digest& digest, const ByteVec& user_id,
                  const ecc::DomainParameters& domain, const ecc::AffinePoint& Q);

/**
 * @brief KDF over whatever the digest has already absorbed
 *
 * Output block i is H(prefix || ct_i) with ct_i = i as a 32-bit big-endian
 * counter starting at 1. The prefix state is cloned once and restored
 * before each counter. The digest is reset on return.
 *
 * @throws std::invalid_argument if out_len needs more than 2^32 - 1 blocks
 */
void kdf_from_state(Digest& digest, uint8_t* out, size_t out_len);

/**
 * @brief KDF(Z, klen) for an explicit shared secret
 */
ByteVec kdf(Digest& digest, const uint8_t* z, size_t z_len, size_t out_len);

} // namespace sm2
} // namespace gmsm

#endif // GMSM_CRYPTO_SM_SM2_UTIL_H
