/**
 * @file sm2_signer.cpp
 * @brief SM2 digital signature implementation
 *
 * Signature generation (GB/T 32918.2 section 6.1):
 *   e = H(Z || M)
 *   (x1, y1) = [k]G
 *   r = (e + x1) mod n, retry if r = 0 or r + k = n
 *   s = ((1 + d)^-1 * (k - r*d)) mod n, retry if s = 0
 *
 * Verification (section 7.1):
 *   t = (r + s) mod n, reject if t = 0
 *   (x1', y1') = [s]G + [t]Q
 *   R = (e + x1') mod n, accept iff R = r
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#include "gmsm/crypto/sm/sm2_signer.h"
#include "gmsm/crypto/sm/sm2_util.h"
#include "gmsm/crypto/sm/sm3.h"
#include "gmsm/core/errors.h"
#include "gmsm/core/security.h"
#include "gmsm/math/field_element.h"

#include <stdexcept>
#include <variant>

namespace gmsm {
namespace sm2 {

using ecc::AffinePoint;
using ecc::ECPrivateKeyParameters;
using ecc::ECPublicKeyParameters;

SM2Signer::SM2Signer(SignatureEncodingPtr encoding, DigestPtr digest,
                     std::unique_ptr<DSAKCalculator> k_calculator)
    : encoding_(std::move(encoding)),
      digest_(std::move(digest)),
      k_calculator_(std::move(k_calculator)) {
    if (!encoding_) {
        encoding_ = std::make_shared<StandardDSAEncoding>();
    }
    if (!digest_) {
        digest_ = std::make_unique<SM3Digest>();
    }
    if (!k_calculator_) {
        k_calculator_ = std::make_unique<RandomDSAKCalculator>();
    }
}

void SM2Signer::init(bool for_signing, const ecc::KeyParameters& key,
                     const std::optional<ByteVec>& user_id, RandomSourcePtr random) {
    ByteVec id = user_id ? *user_id : default_user_id();
    if (id.size() > MAX_USER_ID_LENGTH) {
        throw std::invalid_argument("SM2 user ID too long for ENTL");
    }

    AffinePoint Q;
    if (for_signing) {
        const auto* priv = std::get_if<ECPrivateKeyParameters>(&key);
        if (priv == nullptr) {
            throw StateError("SM2 signing requires a private key");
        }
        private_key_.emplace(*priv);
        public_key_.reset();
        domain_ = priv->domain_ptr();
        Q = priv->public_point();

        if (!random) {
            random = make_system_random();
        }
        k_calculator_->init(domain_->n(), random);
    } else {
        const auto* pub = std::get_if<ECPublicKeyParameters>(&key);
        if (pub == nullptr) {
            throw StateError("SM2 verification requires a public key");
        }
        public_key_.emplace(*pub);
        private_key_.reset();
        domain_ = pub->domain_ptr();
        Q = pub->Q();
    }
    for_signing_ = for_signing;

    z_ = compute_z(*digest_, id, *domain_, Q);

    digest_->update(z_);
    z_state_ = digest_->clone();
}

void SM2Signer::require_init(bool signing) const {
    if (!domain_) {
        throw StateError("SM2Signer not initialized");
    }
    if (signing != for_signing_) {
        throw StateError(signing ? "SM2Signer not initialized for signing"
                                 : "SM2Signer not initialized for verification");
    }
}

void SM2Signer::update(const uint8_t* data, size_t len) {
    if (!domain_) {
        throw StateError("SM2Signer not initialized");
    }
    digest_->update(data, len);
}

void SM2Signer::reset() {
    if (z_state_) {
        digest_->restore(*z_state_);
    } else {
        digest_->reset();
    }
}

ZZ SM2Signer::calculate_e() {
    ByteVec h = digest_->do_final();
    reset();
    return math::zz_from_bytes_be(h.data(), h.size());
}

// ============================================================================
// Signature Generation
// ============================================================================

ByteVec SM2Signer::generate_signature() {
    require_init(true);

    const ZZ& n = domain_->n();
    const ZZ& d = private_key_->d();
    const ZZ e = calculate_e();

    ZZ d_plus_1 = d + 1;
    if (d_plus_1 == n) {
        throw InvalidKeyError("SM2 private key d = n-1 cannot sign");
    }
    const ZZ inv = NTL::InvMod(d_plus_1, n);

    ZZ r, s, k;
    for (;;) {
        k = k_calculator_->next_k();

        AffinePoint kG = domain_->multiply_base(k);
        r = NTL::AddMod(e % n, kG.x.value() % n, n);
        if (NTL::IsZero(r) || (r + k) == n) {
            GMSM_DEBUG_LOG("SM2 sign: r = 0 or r + k = n, retrying");
            continue;
        }

        // s = (1 + d)^-1 * (k - r*d) mod n
        s = NTL::MulMod(inv, NTL::SubMod(k, NTL::MulMod(r, d, n), n), n);
        if (NTL::IsZero(s)) {
            GMSM_DEBUG_LOG("SM2 sign: s = 0, retrying");
            continue;
        }
        break;
    }

    k = 0;
    return encoding_->encode(n, r, s);
}

// ============================================================================
// Signature Verification
// ============================================================================

bool SM2Signer::verify_signature(const uint8_t* sig, size_t sig_len) {
    require_init(false);

    const ZZ& n = domain_->n();
    const ZZ e = calculate_e();

    ZZ r, s;
    try {
        std::pair<ZZ, ZZ> rs = encoding_->decode(n, sig, sig_len);
        r = rs.first;
        s = rs.second;
    } catch (const SignatureFormatError&) {
        GMSM_DEBUG_LOG("SM2 verify: malformed signature");
        return false;
    } catch (const SignatureRangeError&) {
        GMSM_DEBUG_LOG("SM2 verify: r or s out of range");
        return false;
    }

    // Encodings that do not range check themselves
    if (r < 1 || r >= n || s < 1 || s >= n) {
        return false;
    }

    ZZ t = NTL::AddMod(r, s, n);
    if (NTL::IsZero(t)) {
        GMSM_DEBUG_LOG("SM2 verify: t = 0");
        return false;
    }

    AffinePoint P = ecc::sum_of_two_multiplies(domain_->curve(),
                                               domain_->G(), s,
                                               public_key_->Q(), t);
    if (P.is_infinity()) {
        GMSM_DEBUG_LOG("SM2 verify: [s]G + [t]Q is infinity");
        return false;
    }

    ZZ R = NTL::AddMod(e % n, P.x.value() % n, n);
    if (R != r) {
        GMSM_DEBUG_LOG("SM2 verify: R != r");
        return false;
    }
    return true;
}

} // namespace sm2
} // namespace gmsm
