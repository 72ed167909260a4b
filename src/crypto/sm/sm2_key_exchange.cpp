/**
 * @file sm2_key_exchange.cpp
 * @brief SM2 key exchange implementation
 *
 * With w = ceil(ceil(log2 n) / 2) - 1, which for SM2 equals
 * floor((field_bits - 1) / 2) = 127:
 *   x~ = 2^w + (x mod 2^w)
 *   t  = (d + x~_own * r) mod n
 *   U  = [h * t](P_peer + [x~_peer]R_peer)
 *   K  = KDF(xU || yU || Z_A || Z_B, klen)
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#include "gmsm/crypto/sm/sm2_key_exchange.h"
#include "gmsm/crypto/sm/sm2_util.h"
#include "gmsm/crypto/sm/sm3.h"
#include "gmsm/core/errors.h"
#include "gmsm/core/security.h"

#include <limits>
#include <stdexcept>

namespace gmsm {
namespace sm2 {

using ecc::AffinePoint;
using ecc::ECPrivateKeyParameters;
using ecc::ECPublicKeyParameters;

// ============================================================================
// Parameters
// ============================================================================

SM2KeyExchangePrivateParameters::SM2KeyExchangePrivateParameters(
    SM2Role role, const ECPrivateKeyParameters& static_key,
    const ECPrivateKeyParameters& ephemeral_key)
    : role_(role),
      static_key_(static_key),
      static_point_(static_key.public_point()),
      ephemeral_key_(ephemeral_key),
      ephemeral_point_(ephemeral_key.public_point()) {
    if (static_key.domain() != ephemeral_key.domain()) {
        throw InvalidKeyError("static and ephemeral keys have different domains");
    }
}

SM2KeyExchangePublicParameters::SM2KeyExchangePublicParameters(
    const ECPublicKeyParameters& static_key, const ECPublicKeyParameters& ephemeral_key)
    : static_key_(static_key), ephemeral_key_(ephemeral_key) {
    if (static_key.domain() != ephemeral_key.domain()) {
        throw InvalidKeyError("static and ephemeral public keys have different domains");
    }
}

// ============================================================================
// Key Exchange
// ============================================================================

SM2KeyExchange::SM2KeyExchange(DigestPtr digest) : digest_(std::move(digest)) {
    if (!digest_) {
        digest_ = std::make_unique<SM3Digest>();
    }
}

void SM2KeyExchange::init(const SM2KeyExchangePrivateParameters& params,
                          const std::optional<ByteVec>& user_id) {
    ByteVec id = user_id ? *user_id : ByteVec();
    if (id.size() > MAX_USER_ID_LENGTH) {
        throw std::invalid_argument("SM2 user ID too long for ENTL");
    }
    params_.emplace(params);
    user_id_ = std::move(id);
    w_ = (params.static_private_key().domain().curve().field_size() - 1) / 2;
}

ZZ SM2KeyExchange::reduce(const ZZ& x) const {
    ZZ r;
    NTL::trunc(r, x, w_);
    NTL::SetBit(r, w_);
    return r;
}

AffinePoint SM2KeyExchange::calculate_u(const SM2KeyExchangePublicParameters& peer) const {
    const ecc::DomainParameters& domain = params_->static_private_key().domain();
    const ZZ& n = domain.n();

    const AffinePoint& peer_static = peer.static_public_key().Q();
    const AffinePoint& peer_ephemeral = peer.ephemeral_public_key().Q();

    ZZ x1 = reduce(params_->ephemeral_public_point().x.value());
    ZZ x2 = reduce(peer_ephemeral.x.value());

    ZZ t = NTL::AddMod(params_->static_private_key().d(),
                       NTL::MulMod(x1 % n, params_->ephemeral_private_key().d(), n), n);
    ZZ k1 = NTL::MulMod(domain.h() % n, t, n);
    ZZ k2 = NTL::MulMod(k1, x2 % n, n);
    t = 0;

    return ecc::sum_of_two_multiplies(domain.curve(), peer_static, k1, peer_ephemeral, k2);
}

SM2KeyExchange::Agreement SM2KeyExchange::agree(long k_len,
                                                const SM2KeyExchangePublicParameters& peer,
                                                const std::optional<ByteVec>& peer_id) {
    if (k_len <= 0) {
        throw std::invalid_argument("key length must be positive");
    }
    if (k_len > std::numeric_limits<long>::max() - 7) {
        throw std::invalid_argument("key length too large");
    }
    if (!params_) {
        throw StateError("SM2KeyExchange not initialized");
    }

    const ecc::DomainParameters& domain = params_->static_private_key().domain();
    if (peer.static_public_key().domain() != domain) {
        throw InvalidKeyError("peer key uses a different domain");
    }

    ByteVec other_id = peer_id ? *peer_id : ByteVec();
    ByteVec z_self = compute_z(*digest_, user_id_, domain, params_->static_public_point());
    ByteVec z_peer = compute_z(*digest_, other_id, domain, peer.static_public_key().Q());

    AffinePoint U = calculate_u(peer);
    if (U.is_infinity()) {
        GMSM_DEBUG_LOG("SM2 key exchange: U at infinity");
        throw AuthenticationFailure("SM2 key exchange: U at infinity");
    }

    if (params_->is_initiator()) {
        return Agreement{U, std::move(z_self), std::move(z_peer)};
    }
    return Agreement{U, std::move(z_peer), std::move(z_self)};
}

ByteVec SM2KeyExchange::derive_key(const Agreement& a, long k_len) {
    ByteVec key(static_cast<size_t>((k_len + 7) / 8));
    digest_->reset();
    add_field_element(*digest_, a.U.x);
    add_field_element(*digest_, a.U.y);
    digest_->update(a.z_initiator);
    digest_->update(a.z_responder);
    kdf_from_state(*digest_, key.data(), key.size());
    return key;
}

ByteVec SM2KeyExchange::inner_hash(const Agreement& a, const AffinePoint& eph_initiator,
                                   const AffinePoint& eph_responder) {
    digest_->reset();
    add_field_element(*digest_, a.U.x);
    digest_->update(a.z_initiator);
    digest_->update(a.z_responder);
    add_field_element(*digest_, eph_initiator.x);
    add_field_element(*digest_, eph_initiator.y);
    add_field_element(*digest_, eph_responder.x);
    add_field_element(*digest_, eph_responder.y);
    return digest_->do_final();
}

ByteVec SM2KeyExchange::confirmation(uint8_t prefix, const AffinePoint& U,
                                     const ByteVec& inner) {
    digest_->reset();
    digest_->update(prefix);
    add_field_element(*digest_, U.y);
    digest_->update(inner);
    return digest_->do_final();
}

ByteVec SM2KeyExchange::calculate_key(long k_len, const SM2KeyExchangePublicParameters& peer,
                                      const std::optional<ByteVec>& peer_id) {
    Agreement a = agree(k_len, peer, peer_id);
    return derive_key(a, k_len);
}

std::vector<ByteVec> SM2KeyExchange::calculate_key_with_confirmation(
    long k_len, const std::optional<ByteVec>& confirmation_tag,
    const SM2KeyExchangePublicParameters& peer, const std::optional<ByteVec>& peer_id) {
    if (params_ && params_->is_initiator() && !confirmation_tag) {
        throw StateError("initiator requires the responder's confirmation tag");
    }

    Agreement a = agree(k_len, peer, peer_id);
    ByteVec key = derive_key(a, k_len);

    const AffinePoint& own_eph = params_->ephemeral_public_point();
    const AffinePoint& peer_eph = peer.ephemeral_public_key().Q();

    if (params_->is_initiator()) {
        ByteVec inner = inner_hash(a, own_eph, peer_eph);
        ByteVec s1 = confirmation(0x02, a.U, inner);
        if (!secure_compare(s1, *confirmation_tag)) {
            secure_wipe(key);
            GMSM_DEBUG_LOG("SM2 key exchange: S1 mismatch");
            throw AuthenticationFailure("SM2 key exchange: confirmation tag mismatch");
        }
        return {key, confirmation(0x03, a.U, inner)};
    }

    ByteVec inner = inner_hash(a, peer_eph, own_eph);
    return {key, confirmation(0x02, a.U, inner), confirmation(0x03, a.U, inner)};
}

} // namespace sm2
} // namespace gmsm
