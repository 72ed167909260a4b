/**
 * @file sm2.cpp
 * @brief SM2 C ABI and C++ facade
 *
 * C entry points catch every exception and report it as a gmsm_error_t;
 * the C++ facade lets them propagate.
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#include "gmsm/crypto/sm/sm2.h"
#include "gmsm/crypto/sm/sm2_signer.h"
#include "gmsm/crypto/sm/sm2_util.h"
#include "gmsm/core/errors.h"
#include "gmsm/core/security.h"
#include "gmsm/utils/encoding.h"

#include <cstring>
#include <new>
#include <stdexcept>

namespace gmsm {
namespace sm2 {

// ============================================================================
// C++ Facade
// ============================================================================

SM2::SM2(ecc::DomainParametersPtr domain, RandomSourcePtr random)
    : domain_(domain ? std::move(domain) : ecc::make_sm2_domain()),
      random_(random ? std::move(random) : make_system_random()) {}

ecc::ECKeyPair SM2::generate_keypair() const {
    return ecc::generate_key_pair(domain_, *random_);
}

ecc::ECPrivateKeyParameters SM2::private_key(const ByteVec& encoded) const {
    return ecc::ECPrivateKeyParameters::decode(domain_, encoded.data(), encoded.size());
}

ecc::ECPublicKeyParameters SM2::public_key(const ByteVec& encoded) const {
    return ecc::ECPublicKeyParameters::decode(domain_, encoded.data(), encoded.size());
}

ByteVec SM2::sign(const ecc::ECPrivateKeyParameters& key, const ByteVec& message,
                  const std::optional<ByteVec>& user_id) const {
    SM2Signer signer;
    signer.init(true, key, user_id, random_);
    signer.update(message);
    return signer.generate_signature();
}

bool SM2::verify(const ecc::ECPublicKeyParameters& key, const ByteVec& message,
                 const ByteVec& signature, const std::optional<ByteVec>& user_id) const {
    SM2Signer verifier;
    verifier.init(false, key, user_id);
    verifier.update(message);
    return verifier.verify_signature(signature);
}

ByteVec SM2::encrypt(const ecc::ECPublicKeyParameters& key, const ByteVec& plaintext,
                     SM2Mode mode) const {
    SM2Engine engine(mode);
    engine.init(true, key, random_);
    return engine.process_block(plaintext);
}

ByteVec SM2::decrypt(const ecc::ECPrivateKeyParameters& key, const ByteVec& ciphertext,
                     SM2Mode mode) const {
    SM2Engine engine(mode);
    engine.init(false, key);
    return engine.process_block(ciphertext);
}

} // namespace sm2
} // namespace gmsm

// ============================================================================
// C API Implementation (extern "C")
// ============================================================================

struct gmsm_sm2_ctx {
    gmsm::sm2::SM2 sm2;
};

namespace {

using gmsm::ByteVec;

/**
 * @brief Run f, translating exceptions into error codes
 */
template <typename F>
gmsm_error_t guarded(F&& f) {
    try {
        return f();
    } catch (const gmsm::CryptoError& e) {
        GMSM_DEBUG_LOG("C API: " << e.what());
        return e.code();
    } catch (const gmsm::StateError& e) {
        GMSM_DEBUG_LOG("C API: " << e.what());
        return GMSM_ERROR_INVALID_PARAM;
    } catch (const std::invalid_argument& e) {
        GMSM_DEBUG_LOG("C API: " << e.what());
        return GMSM_ERROR_INVALID_PARAM;
    } catch (const std::bad_alloc&) {
        return GMSM_ERROR_MEMORY_ALLOC;
    } catch (const std::exception& e) {
        GMSM_DEBUG_LOG("C API: " << e.what());
        return GMSM_ERROR_INTERNAL;
    }
}

gmsm::sm2::SM2Mode to_mode(gmsm_sm2_mode_t mode) {
    switch (mode) {
        case GMSM_SM2_MODE_C1C2C3: return gmsm::sm2::SM2Mode::C1C2C3;
        case GMSM_SM2_MODE_C1C3C2: return gmsm::sm2::SM2Mode::C1C3C2;
    }
    throw std::invalid_argument("unknown SM2 ciphertext mode");
}

std::optional<ByteVec> to_user_id(const uint8_t* user_id, size_t user_id_len) {
    if (user_id == nullptr) {
        return std::nullopt;
    }
    return ByteVec(user_id, user_id + user_id_len);
}

gmsm_error_t copy_out(const ByteVec& data, uint8_t* out, size_t* out_len) {
    if (*out_len < data.size()) {
        *out_len = data.size();
        return GMSM_ERROR_BUFFER_TOO_SMALL;
    }
    std::memcpy(out, data.data(), data.size());
    *out_len = data.size();
    return GMSM_SUCCESS;
}

} // namespace

extern "C" {

gmsm_sm2_ctx_t* gmsm_sm2_ctx_new(void) {
    try {
        return new gmsm_sm2_ctx_t{gmsm::sm2::SM2()};
    } catch (const std::exception& e) {
        GMSM_DEBUG_LOG("gmsm_sm2_ctx_new: " << e.what());
        return nullptr;
    }
}

void gmsm_sm2_ctx_free(gmsm_sm2_ctx_t* ctx) {
    delete ctx;
}

gmsm_error_t gmsm_sm2_generate_keypair(gmsm_sm2_ctx_t* ctx, gmsm_sm2_keypair_t* keypair) {
    if (ctx == nullptr || keypair == nullptr) {
        return GMSM_ERROR_INVALID_PARAM;
    }
    return guarded([&]() {
        gmsm::ecc::ECKeyPair kp = ctx->sm2.generate_keypair();
        ByteVec d = kp.private_key.encode();
        ByteVec Q = kp.public_key.encode(false);
        std::memcpy(keypair->private_key, d.data(), GMSM_SM2_PRIVATE_KEY_SIZE);
        std::memcpy(keypair->public_key, Q.data(), GMSM_SM2_PUBLIC_KEY_SIZE);
        gmsm::secure_wipe(d);
        return GMSM_SUCCESS;
    });
}

gmsm_error_t gmsm_sm2_sign(gmsm_sm2_ctx_t* ctx,
                           const uint8_t private_key[GMSM_SM2_PRIVATE_KEY_SIZE],
                           const uint8_t* user_id, size_t user_id_len,
                           const uint8_t* message, size_t message_len,
                           uint8_t* signature, size_t* signature_len) {
    if (ctx == nullptr || private_key == nullptr || signature_len == nullptr ||
        (message == nullptr && message_len != 0)) {
        return GMSM_ERROR_INVALID_PARAM;
    }
    if (signature == nullptr) {
        *signature_len = GMSM_SM2_SIGNATURE_MAX_DER;
        return GMSM_SUCCESS;
    }
    return guarded([&]() {
        auto key = ctx->sm2.private_key(ByteVec(private_key,
                                                private_key + GMSM_SM2_PRIVATE_KEY_SIZE));
        ByteVec msg = message ? ByteVec(message, message + message_len) : ByteVec();
        ByteVec sig = ctx->sm2.sign(key, msg, to_user_id(user_id, user_id_len));
        return copy_out(sig, signature, signature_len);
    });
}

gmsm_error_t gmsm_sm2_verify(gmsm_sm2_ctx_t* ctx,
                             const uint8_t* public_key, size_t public_key_len,
                             const uint8_t* user_id, size_t user_id_len,
                             const uint8_t* message, size_t message_len,
                             const uint8_t* signature, size_t signature_len) {
    if (ctx == nullptr || public_key == nullptr || signature == nullptr ||
        (message == nullptr && message_len != 0)) {
        return GMSM_ERROR_INVALID_PARAM;
    }
    return guarded([&]() {
        auto key = ctx->sm2.public_key(ByteVec(public_key, public_key + public_key_len));
        ByteVec msg = message ? ByteVec(message, message + message_len) : ByteVec();
        bool ok = ctx->sm2.verify(key, msg, ByteVec(signature, signature + signature_len),
                                  to_user_id(user_id, user_id_len));
        return ok ? GMSM_SUCCESS : GMSM_ERROR_VERIFICATION_FAILED;
    });
}

gmsm_error_t gmsm_sm2_encrypt(gmsm_sm2_ctx_t* ctx, gmsm_sm2_mode_t mode,
                              const uint8_t* public_key, size_t public_key_len,
                              const uint8_t* plaintext, size_t plaintext_len,
                              uint8_t* ciphertext, size_t* ciphertext_len) {
    if (ctx == nullptr || public_key == nullptr || plaintext == nullptr ||
        ciphertext_len == nullptr) {
        return GMSM_ERROR_INVALID_PARAM;
    }
    if (plaintext_len == 0) {
        return GMSM_ERROR_INPUT_TOO_SHORT;
    }
    if (ciphertext == nullptr) {
        *ciphertext_len = GMSM_SM2_CIPHERTEXT_OVERHEAD + plaintext_len;
        return GMSM_SUCCESS;
    }
    return guarded([&]() {
        auto key = ctx->sm2.public_key(ByteVec(public_key, public_key + public_key_len));
        ByteVec ct = ctx->sm2.encrypt(key, ByteVec(plaintext, plaintext + plaintext_len),
                                      to_mode(mode));
        return copy_out(ct, ciphertext, ciphertext_len);
    });
}

gmsm_error_t gmsm_sm2_decrypt(gmsm_sm2_ctx_t* ctx, gmsm_sm2_mode_t mode,
                              const uint8_t private_key[GMSM_SM2_PRIVATE_KEY_SIZE],
                              const uint8_t* ciphertext, size_t ciphertext_len,
                              uint8_t* plaintext, size_t* plaintext_len) {
    if (ctx == nullptr || private_key == nullptr || ciphertext == nullptr ||
        plaintext_len == nullptr) {
        return GMSM_ERROR_INVALID_PARAM;
    }
    if (ciphertext_len <= GMSM_SM2_CIPHERTEXT_OVERHEAD) {
        return GMSM_ERROR_INPUT_TOO_SHORT;
    }
    if (plaintext == nullptr) {
        *plaintext_len = ciphertext_len - GMSM_SM2_CIPHERTEXT_OVERHEAD;
        return GMSM_SUCCESS;
    }
    return guarded([&]() {
        auto key = ctx->sm2.private_key(ByteVec(private_key,
                                                private_key + GMSM_SM2_PRIVATE_KEY_SIZE));
        ByteVec pt = ctx->sm2.decrypt(key, ByteVec(ciphertext, ciphertext + ciphertext_len),
                                      to_mode(mode));
        gmsm_error_t rc = copy_out(pt, plaintext, plaintext_len);
        gmsm::secure_wipe(pt);
        return rc;
    });
}

gmsm_error_t gmsm_sm2_self_test(void) {
    static const char* const kPrivateKey =
        "128B2FA8BD433C6C068C8D803DFF79792A519A55171B1B650C23661D15897263";

    return guarded([&]() {
        gmsm::sm2::SM2 sm2;
        auto priv = sm2.private_key(gmsm::encoding::hexDecode(kPrivateKey));
        gmsm::ecc::ECPublicKeyParameters pub(sm2.domain(), priv.public_point());

        const ByteVec msg = {'a', 'b', 'c'};
        ByteVec sig = sm2.sign(priv, msg);
        if (!sm2.verify(pub, msg, sig)) {
            return GMSM_ERROR_VERIFICATION_FAILED;
        }

        sig.back() ^= 0x01;
        if (sm2.verify(pub, msg, sig)) {
            return GMSM_ERROR_VERIFICATION_FAILED;
        }

        ByteVec ct = sm2.encrypt(pub, msg);
        if (sm2.decrypt(priv, ct) != msg) {
            return GMSM_ERROR_DECRYPTION_FAILED;
        }
        return GMSM_SUCCESS;
    });
}

} // extern "C"
