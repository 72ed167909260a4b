/**
 * @file sm3.h
 * @brief SM3 cryptographic hash function (GB/T 32905-2016)
 *
 * 256-bit output, 512-bit blocks. C API for incremental and one-shot use,
 * plus SM3Digest implementing the gmsm::Digest interface.
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#ifndef GMSM_CRYPTO_SM_SM3_H
#define GMSM_CRYPTO_SM_SM3_H

#include "gmsm/core/common.h"

#ifdef __cplusplus
extern "C" {
#endif

// SM3 context structure
typedef struct {
    uint32_t state[8];
    uint64_t count;       // bytes processed
    uint8_t buffer[64];
} gmsm_sm3_ctx_t;

/**
 * @brief Initialize SM3 context
 */
GMSM_API void gmsm_sm3_init(gmsm_sm3_ctx_t* ctx);

/**
 * @brief Absorb data
 * @param ctx Initialized context
 * @param data Input data
 * @param len Data length
 */
GMSM_API void gmsm_sm3_update(gmsm_sm3_ctx_t* ctx, const uint8_t* data, size_t len);

/**
 * @brief Finish, write the 32-byte digest and wipe the context
 */
GMSM_API void gmsm_sm3_final(gmsm_sm3_ctx_t* ctx, uint8_t digest[32]);

/**
 * @brief One-call SM3
 * @return GMSM_SUCCESS or GMSM_ERROR_INVALID_PARAM
 */
GMSM_API gmsm_error_t gmsm_sm3(const uint8_t* data, size_t len, uint8_t digest[32]);

/**
 * @brief Known-answer test on "abc"
 * @return GMSM_SUCCESS if the test passes
 */
GMSM_API gmsm_error_t gmsm_sm3_self_test(void);

#ifdef __cplusplus
}

#include "gmsm/crypto/digest.h"
#include "gmsm/core/types.h"

#include <string>

namespace gmsm {

/**
 * @brief SM3 as a Digest
 */
class SM3Digest : public Digest {
public:
    SM3Digest();
    SM3Digest(const SM3Digest& other) = default;
    SM3Digest& operator=(const SM3Digest& other) = default;
    ~SM3Digest() override;

    std::string algorithm_name() const override { return "SM3"; }
    size_t digest_size() const override { return GMSM_SM3_DIGEST_SIZE; }
    size_t block_size() const override { return GMSM_SM3_BLOCK_SIZE; }

    using Digest::update;
    using Digest::do_final;

    void update(const uint8_t* data, size_t len) override;
    void do_final(uint8_t* out) override;
    void reset() override;

    std::unique_ptr<Digest> clone() const override;
    void restore(const Digest& other) override;

    // One-shot hashing
    static SM3Hash hash(const ByteVec& data);
    static SM3Hash hash(const std::string& str);
    static std::string hash_hex(const ByteVec& data);

private:
    gmsm_sm3_ctx_t ctx_;
};

} // namespace gmsm

#endif // __cplusplus

#endif // GMSM_CRYPTO_SM_SM3_H
