/**
 * @file sm3.cpp
 * @brief SM3 hash: compression function, C API and Digest adapter
 *
 * GB/T 32905-2016. Rounds use a precomputed T[j] = ROTL32(T, j mod 32)
 * table instead of rotating at run time.
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#include "gmsm/crypto/sm/sm3.h"
#include "gmsm/core/security.h"
#include "gmsm/utils/encoding.h"

#include <array>
#include <cstring>
#include <cstdint>
#include <stdexcept>

// ============================================================================
// Compression function
// ============================================================================

namespace gmsm::internal {

alignas(64) constexpr std::array<uint32_t, 64> SM3_T_TABLE = {
    // T[0..15]: ROTL32(0x79CC4519, j)
    0x79CC4519, 0xF3988A32, 0xE7311465, 0xCE6228CB,
    0x9CC45197, 0x3988A32F, 0x7311465E, 0xE6228CBC,
    0xCC451979, 0x988A32F3, 0x311465E7, 0x6228CBCE,
    0xC451979C, 0x88A32F39, 0x11465E73, 0x228CBCE6,
    // T[16..63]: ROTL32(0x7A879D8A, j mod 32)
    0x9D8A7A87, 0x3B14F50F, 0x7629EA1E, 0xEC53D43C,
    0xD8A7A879, 0xB14F50F3, 0x629EA1E7, 0xC53D43CE,
    0x8A7A879D, 0x14F50F3B, 0x29EA1E76, 0x53D43CEC,
    0xA7A879D8, 0x4F50F3B1, 0x9EA1E762, 0x3D43CEC5,
    0x7A879D8A, 0xF50F3B14, 0xEA1E7629, 0xD43CEC53,
    0xA879D8A7, 0x50F3B14F, 0xA1E7629E, 0x43CEC53D,
    0x879D8A7A, 0x0F3B14F5, 0x1E7629EA, 0x3CEC53D4,
    0x79D8A7A8, 0xF3B14F50, 0xE7629EA1, 0xCEC53D43,
    0x9D8A7A87, 0x3B14F50F, 0x7629EA1E, 0xEC53D43C,
    0xD8A7A879, 0xB14F50F3, 0x629EA1E7, 0xC53D43CE,
    0x8A7A879D, 0x14F50F3B, 0x29EA1E76, 0x53D43CEC,
    0xA7A879D8, 0x4F50F3B1, 0x9EA1E762, 0x3D43CEC5
};

constexpr std::array<uint32_t, 8> SM3_IV = {
    0x7380166F, 0x4914B2B9, 0x172442D7, 0xDA8A0600,
    0xA96F30BC, 0x163138AA, 0xE38DEE4D, 0xB0FB0E4E
};

#define SM3_ROTL32(x, n) (((x) << ((n) & 31)) | ((x) >> ((32 - (n)) & 31)))

#define SM3_FF0(x, y, z) ((x) ^ (y) ^ (z))
#define SM3_FF1(x, y, z) (((x) & (y)) | ((x) & (z)) | ((y) & (z)))
#define SM3_GG0(x, y, z) ((x) ^ (y) ^ (z))
#define SM3_GG1(x, y, z) (((x) & (y)) | ((~(x)) & (z)))

#define SM3_P0(x) ((x) ^ SM3_ROTL32((x), 9) ^ SM3_ROTL32((x), 17))
#define SM3_P1(x) ((x) ^ SM3_ROTL32((x), 15) ^ SM3_ROTL32((x), 23))

static inline uint32_t load32_be(const uint8_t* p) noexcept {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | p[3];
}

class SM3Compressor {
public:
    static void expand_message(const uint8_t block[64], uint32_t W[68], uint32_t W1[64]) noexcept {
        for (size_t i = 0; i < 16; i++) {
            W[i] = load32_be(block + i * 4);
        }
        for (size_t i = 16; i < 68; i++) {
            uint32_t tmp = W[i - 16] ^ W[i - 9] ^ SM3_ROTL32(W[i - 3], 15);
            W[i] = SM3_P1(tmp) ^ SM3_ROTL32(W[i - 13], 7) ^ W[i - 6];
        }
        for (size_t i = 0; i < 64; i++) {
            W1[i] = W[i] ^ W[i + 4];
        }
    }

    static void compress(gmsm_sm3_ctx_t* ctx, const uint8_t block[64]) noexcept {
        uint32_t W[68], W1[64];
        expand_message(block, W, W1);

        uint32_t A = ctx->state[0], B = ctx->state[1];
        uint32_t C = ctx->state[2], D = ctx->state[3];
        uint32_t E = ctx->state[4], F = ctx->state[5];
        uint32_t G = ctx->state[6], H = ctx->state[7];
        uint32_t SS1, SS2, TT1, TT2;

        for (size_t j = 0; j < 64; j++) {
            SS1 = SM3_ROTL32((SM3_ROTL32(A, 12) + E + SM3_T_TABLE[j]), 7);
            SS2 = SS1 ^ SM3_ROTL32(A, 12);
            if (j < 16) {
                TT1 = SM3_FF0(A, B, C) + D + SS2 + W1[j];
                TT2 = SM3_GG0(E, F, G) + H + SS1 + W[j];
            } else {
                TT1 = SM3_FF1(A, B, C) + D + SS2 + W1[j];
                TT2 = SM3_GG1(E, F, G) + H + SS1 + W[j];
            }
            D = C; C = SM3_ROTL32(B, 9); B = A; A = TT1;
            H = G; G = SM3_ROTL32(F, 19); F = E; E = SM3_P0(TT2);
        }

        ctx->state[0] ^= A;
        ctx->state[1] ^= B;
        ctx->state[2] ^= C;
        ctx->state[3] ^= D;
        ctx->state[4] ^= E;
        ctx->state[5] ^= F;
        ctx->state[6] ^= G;
        ctx->state[7] ^= H;
    }
};

#undef SM3_ROTL32
#undef SM3_FF0
#undef SM3_FF1
#undef SM3_GG0
#undef SM3_GG1
#undef SM3_P0
#undef SM3_P1

} // namespace gmsm::internal

// ============================================================================
// C ABI Export (extern "C")
// ============================================================================

extern "C" {

void gmsm_sm3_init(gmsm_sm3_ctx_t* ctx) {
    if (!ctx) return;

    std::memcpy(ctx->state, gmsm::internal::SM3_IV.data(), sizeof(ctx->state));
    ctx->count = 0;
    std::memset(ctx->buffer, 0, sizeof(ctx->buffer));
}

void gmsm_sm3_update(gmsm_sm3_ctx_t* ctx, const uint8_t* data, size_t len) {
    if (!ctx || len == 0 || !data) return;

    size_t buffer_used = ctx->count & 0x3F;
    ctx->count += len;

    if (buffer_used > 0) {
        size_t buffer_space = 64 - buffer_used;
        if (len < buffer_space) {
            std::memcpy(ctx->buffer + buffer_used, data, len);
            return;
        }

        std::memcpy(ctx->buffer + buffer_used, data, buffer_space);
        gmsm::internal::SM3Compressor::compress(ctx, ctx->buffer);
        data += buffer_space;
        len -= buffer_space;
    }

    while (len >= 64) {
        gmsm::internal::SM3Compressor::compress(ctx, data);
        data += 64;
        len -= 64;
    }

    if (len > 0) {
        std::memcpy(ctx->buffer, data, len);
    }
}

void gmsm_sm3_final(gmsm_sm3_ctx_t* ctx, uint8_t digest[32]) {
    if (!ctx || !digest) return;

    size_t used = ctx->count & 0x3F;
    uint64_t bit_len = ctx->count * 8;

    ctx->buffer[used++] = 0x80;

    if (used > 56) {
        std::memset(ctx->buffer + used, 0, 64 - used);
        gmsm::internal::SM3Compressor::compress(ctx, ctx->buffer);
        used = 0;
    }

    std::memset(ctx->buffer + used, 0, 56 - used);
    gmsm_store32_be(ctx->buffer + 56, static_cast<uint32_t>(bit_len >> 32));
    gmsm_store32_be(ctx->buffer + 60, static_cast<uint32_t>(bit_len));

    gmsm::internal::SM3Compressor::compress(ctx, ctx->buffer);

    for (size_t i = 0; i < 8; i++) {
        gmsm_store32_be(digest + i * 4, ctx->state[i]);
    }

    gmsm_secure_zero(ctx, sizeof(*ctx));
}

gmsm_error_t gmsm_sm3(const uint8_t* data, size_t len, uint8_t digest[32]) {
    if (!digest || (!data && len > 0)) {
        return GMSM_ERROR_INVALID_PARAM;
    }

    gmsm_sm3_ctx_t ctx;
    gmsm_sm3_init(&ctx);
    gmsm_sm3_update(&ctx, data, len);
    gmsm_sm3_final(&ctx, digest);

    return GMSM_SUCCESS;
}

gmsm_error_t gmsm_sm3_self_test(void) {
    // GB/T 32905-2016 Appendix A, example 1
    const uint8_t test_msg[] = {'a', 'b', 'c'};
    const uint8_t expected[] = {
        0x66, 0xc7, 0xf0, 0xf4, 0x62, 0xee, 0xed, 0xd9,
        0xd1, 0xf2, 0xd4, 0x6b, 0xdc, 0x10, 0xe4, 0xe2,
        0x41, 0x67, 0xc4, 0x87, 0x5c, 0xf2, 0xf7, 0xa2,
        0x29, 0x7d, 0xa0, 0x2b, 0x8f, 0x4b, 0xa8, 0xe0
    };

    uint8_t digest[32];
    gmsm_sm3(test_msg, sizeof(test_msg), digest);

    if (std::memcmp(digest, expected, 32) != 0) {
        return GMSM_ERROR_VERIFICATION_FAILED;
    }
    return GMSM_SUCCESS;
}

} // extern "C"

// ============================================================================
// SM3Digest
// ============================================================================

namespace gmsm {

SM3Digest::SM3Digest() {
    gmsm_sm3_init(&ctx_);
}

SM3Digest::~SM3Digest() {
    gmsm_secure_zero(&ctx_, sizeof(ctx_));
}

void SM3Digest::update(const uint8_t* data, size_t len) {
    gmsm_sm3_update(&ctx_, data, len);
}

void SM3Digest::do_final(uint8_t* out) {
    gmsm_sm3_final(&ctx_, out);
    gmsm_sm3_init(&ctx_);
}

void SM3Digest::reset() {
    gmsm_sm3_init(&ctx_);
}

std::unique_ptr<Digest> SM3Digest::clone() const {
    return std::make_unique<SM3Digest>(*this);
}

void SM3Digest::restore(const Digest& other) {
    const SM3Digest* src = dynamic_cast<const SM3Digest*>(&other);
    if (src == nullptr) {
        throw std::invalid_argument("SM3Digest::restore: state from " + other.algorithm_name());
    }
    ctx_ = src->ctx_;
}

SM3Hash SM3Digest::hash(const ByteVec& data) {
    SM3Hash result;
    gmsm_sm3(data.data(), data.size(), result.data());
    return result;
}

SM3Hash SM3Digest::hash(const std::string& str) {
    SM3Hash result;
    gmsm_sm3(reinterpret_cast<const uint8_t*>(str.data()), str.size(), result.data());
    return result;
}

std::string SM3Digest::hash_hex(const ByteVec& data) {
    SM3Hash digest = hash(data);
    return encoding::hexEncode(digest.data(), digest.size());
}

} // namespace gmsm
