/**
 * @file sm2_engine.cpp
 * @brief SM2 public key encryption implementation
 *
 * Encryption (GB/T 32918.4 section 6.1):
 *   C1 = [k]G
 *   (x2, y2) = [k]Q
 *   t = KDF(x2 || y2, klen), retry with a new k if t is all zero
 *   C2 = M xor t
 *   C3 = H(x2 || M || y2)
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#include "gmsm/crypto/sm/sm2_engine.h"
#include "gmsm/crypto/sm/sm2_util.h"
#include "gmsm/crypto/sm/sm3.h"
#include "gmsm/core/errors.h"
#include "gmsm/core/security.h"

#include <cstring>
#include <variant>

namespace gmsm {
namespace sm2 {

using ecc::AffinePoint;
using ecc::ECPrivateKeyParameters;
using ecc::ECPublicKeyParameters;

SM2Engine::SM2Engine(SM2Mode mode, DigestPtr digest)
    : mode_(mode), digest_(std::move(digest)) {
    if (!digest_) {
        digest_ = std::make_unique<SM3Digest>();
    }
}

void SM2Engine::init(bool for_encryption, const ecc::KeyParameters& key,
                     RandomSourcePtr random) {
    if (for_encryption) {
        const auto* pub = std::get_if<ECPublicKeyParameters>(&key);
        if (pub == nullptr) {
            throw StateError("SM2 encryption requires a public key");
        }
        if (pub->domain().multiply(pub->Q(), pub->domain().h()).is_infinity()) {
            throw InvalidKeyError("invalid key: [h]Q at infinity");
        }
        public_key_.emplace(*pub);
        private_key_.reset();
        domain_ = pub->domain_ptr();
        random_ = random ? std::move(random) : make_system_random();
    } else {
        const auto* priv = std::get_if<ECPrivateKeyParameters>(&key);
        if (priv == nullptr) {
            throw StateError("SM2 decryption requires a private key");
        }
        private_key_.emplace(*priv);
        public_key_.reset();
        domain_ = priv->domain_ptr();
        random_.reset();
    }
    for_encryption_ = for_encryption;
}

ByteVec SM2Engine::process_block(const uint8_t* in, size_t in_len) {
    if (!domain_) {
        throw StateError("SM2Engine not initialized");
    }
    if (in == nullptr && in_len != 0) {
        throw std::invalid_argument("SM2Engine: null input");
    }
    return for_encryption_ ? encrypt(in, in_len) : decrypt(in, in_len);
}

size_t SM2Engine::get_output_size(size_t input_len) const {
    size_t coord = domain_ ? domain_->curve().coordinate_size() : GMSM_SM2_FIELD_SIZE;
    return (1 + 2 * coord) + input_len + digest_->digest_size();
}

void SM2Engine::derive_keystream(const AffinePoint& P, uint8_t* out, size_t len) {
    digest_->reset();
    add_field_element(*digest_, P.x);
    add_field_element(*digest_, P.y);
    kdf_from_state(*digest_, out, len);
}

ByteVec SM2Engine::compute_c3(const AffinePoint& P, const uint8_t* msg, size_t len) {
    digest_->reset();
    add_field_element(*digest_, P.x);
    digest_->update(msg, len);
    add_field_element(*digest_, P.y);
    return digest_->do_final();
}

// ============================================================================
// Encryption
// ============================================================================

ByteVec SM2Engine::encrypt(const uint8_t* in, size_t in_len) {
    if (in_len == 0) {
        throw InputTooShortError("SM2 encrypt: empty plaintext");
    }

    const ecc::DomainParameters& domain = *domain_;
    ByteVec t(in_len);
    ByteVec c1;
    AffinePoint kQ;

    for (;;) {
        ZZ k = random_scalar(*random_, domain.n());

        c1 = domain.curve().encode_point(domain.multiply_base(k), false);
        kQ = domain.multiply(public_key_->Q(), k);
        k = 0;

        derive_keystream(kQ, t.data(), t.size());

        bool all_zero = true;
        for (uint8_t b : t) {
            if (b != 0) {
                all_zero = false;
                break;
            }
        }
        if (!all_zero) {
            break;
        }
        GMSM_DEBUG_LOG("SM2 encrypt: KDF output all zero, retrying");
    }

    ByteVec c2(in_len);
    for (size_t i = 0; i < in_len; i++) {
        c2[i] = in[i] ^ t[i];
    }
    secure_wipe(t);

    ByteVec c3 = compute_c3(kQ, in, in_len);

    ByteVec out;
    out.reserve(c1.size() + c2.size() + c3.size());
    out.insert(out.end(), c1.begin(), c1.end());
    if (mode_ == SM2Mode::C1C3C2) {
        out.insert(out.end(), c3.begin(), c3.end());
        out.insert(out.end(), c2.begin(), c2.end());
    } else {
        out.insert(out.end(), c2.begin(), c2.end());
        out.insert(out.end(), c3.begin(), c3.end());
    }
    return out;
}

// ============================================================================
// Decryption
// ============================================================================

ByteVec SM2Engine::decrypt(const uint8_t* in, size_t in_len) {
    const ecc::DomainParameters& domain = *domain_;
    const size_t c1_len = 1 + 2 * domain.curve().coordinate_size();
    const size_t c3_len = digest_->digest_size();

    if (in_len <= c1_len + c3_len) {
        throw InputTooShortError("SM2 decrypt: ciphertext too short");
    }
    if (in[0] != 0x04) {
        throw InvalidPointError("SM2 decrypt: C1 must be uncompressed");
    }

    AffinePoint C1 = domain.curve().decode_point(in, c1_len);
    if (domain.multiply(C1, domain.h()).is_infinity()) {
        throw InvalidPointError("SM2 decrypt: [h]C1 at infinity");
    }

    AffinePoint dC1 = domain.multiply(C1, private_key_->d());
    if (dC1.is_infinity()) {
        throw InvalidPointError("SM2 decrypt: [d]C1 at infinity");
    }

    const size_t c2_len = in_len - c1_len - c3_len;
    const uint8_t* c2;
    const uint8_t* c3;
    if (mode_ == SM2Mode::C1C3C2) {
        c3 = in + c1_len;
        c2 = in + c1_len + c3_len;
    } else {
        c2 = in + c1_len;
        c3 = in + c1_len + c2_len;
    }

    ByteVec m(c2_len);
    derive_keystream(dC1, m.data(), m.size());
    for (size_t i = 0; i < c2_len; i++) {
        m[i] ^= c2[i];
    }

    ByteVec expected = compute_c3(dC1, m.data(), m.size());
    int diff = gmsm_secure_compare(expected.data(), c3, c3_len);
    secure_wipe(expected);

    if (diff != 0) {
        secure_wipe(m);
        GMSM_DEBUG_LOG("SM2 decrypt: C3 mismatch");
        throw AuthenticationFailure("SM2 decrypt: invalid cipher text");
    }
    return m;
}

} // namespace sm2
} // namespace gmsm
