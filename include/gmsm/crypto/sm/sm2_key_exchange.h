/**
 * @file sm2_key_exchange.h
 * @brief SM2 key exchange protocol (GB/T 32918.3-2016)
 *
 * Each party holds a static and an ephemeral key pair. Public halves and
 * identities travel out of band; both sides then derive the same key.
 * With confirmation, the responder sends S1 (and keeps S2 to check the
 * initiator's reply), the initiator checks S1 and answers with S2.
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#ifndef GMSM_CRYPTO_SM_SM2_KEY_EXCHANGE_H
#define GMSM_CRYPTO_SM_SM2_KEY_EXCHANGE_H

#include "gmsm/crypto/digest.h"
#include "gmsm/crypto/ecc/ec_params.h"

#include <optional>
#include <vector>

namespace gmsm {
namespace sm2 {

enum class SM2Role {
    Initiator,
    Responder
};

/**
 * @brief Own side of the exchange
 * @throws InvalidKeyError if the two keys use different domains
 */
class SM2KeyExchangePrivateParameters {
public:
    SM2KeyExchangePrivateParameters(SM2Role role,
                                    const ecc::ECPrivateKeyParameters& static_key,
                                    const ecc::ECPrivateKeyParameters& ephemeral_key);

    SM2Role role() const { return role_; }
    bool is_initiator() const { return role_ == SM2Role::Initiator; }

    const ecc::ECPrivateKeyParameters& static_private_key() const { return static_key_; }
    const ecc::AffinePoint& static_public_point() const { return static_point_; }
    const ecc::ECPrivateKeyParameters& ephemeral_private_key() const { return ephemeral_key_; }
    const ecc::AffinePoint& ephemeral_public_point() const { return ephemeral_point_; }

private:
    SM2Role role_;
    ecc::ECPrivateKeyParameters static_key_;
    ecc::AffinePoint static_point_;
    ecc::ECPrivateKeyParameters ephemeral_key_;
    ecc::AffinePoint ephemeral_point_;
};

/**
 * @brief Peer side of the exchange
 * @throws InvalidKeyError if the two keys use different domains
 */
class SM2KeyExchangePublicParameters {
public:
    SM2KeyExchangePublicParameters(const ecc::ECPublicKeyParameters& static_key,
                                   const ecc::ECPublicKeyParameters& ephemeral_key);

    const ecc::ECPublicKeyParameters& static_public_key() const { return static_key_; }
    const ecc::ECPublicKeyParameters& ephemeral_public_key() const { return ephemeral_key_; }

private:
    ecc::ECPublicKeyParameters static_key_;
    ecc::ECPublicKeyParameters ephemeral_key_;
};

class SM2KeyExchange {
public:
    /** Null digest selects SM3 */
    explicit SM2KeyExchange(DigestPtr digest = nullptr);

    SM2KeyExchange(const SM2KeyExchange&) = delete;
    SM2KeyExchange& operator=(const SM2KeyExchange&) = delete;

    /**
     * @param user_id Own identity; empty when absent
     * @throws std::invalid_argument if user_id is longer than 8191 bytes
     */
    void init(const SM2KeyExchangePrivateParameters& params,
              const std::optional<ByteVec>& user_id = std::nullopt);

    /**
     * @brief Shared key of ceil(k_len / 8) bytes, no confirmation
     *
     * @param k_len Key length in bits
     * @param peer_id Peer identity; empty when absent
     *
     * @throws std::invalid_argument if k_len <= 0
     * @throws StateError before init()
     * @throws InvalidKeyError if the peer keys use another domain
     * @throws AuthenticationFailure if U is infinity
     */
    ByteVec calculate_key(long k_len, const SM2KeyExchangePublicParameters& peer,
                          const std::optional<ByteVec>& peer_id = std::nullopt);

    /**
     * @brief Shared key with confirmation tags
     *
     * Responder: returns {key, S1, S2}; confirmation_tag is ignored.
     * Initiator: confirmation_tag must be the responder's S1; returns
     * {key, S2}.
     *
     * @throws StateError if the initiator passes no tag
     * @throws AuthenticationFailure if the tag does not match
     */
    std::vector<ByteVec> calculate_key_with_confirmation(
        long k_len, const std::optional<ByteVec>& confirmation_tag,
        const SM2KeyExchangePublicParameters& peer,
        const std::optional<ByteVec>& peer_id = std::nullopt);

private:
    struct Agreement {
        ecc::AffinePoint U;
        ByteVec z_initiator;
        ByteVec z_responder;
    };

    Agreement agree(long k_len, const SM2KeyExchangePublicParameters& peer,
                    const std::optional<ByteVec>& peer_id);

    ZZ reduce(const ZZ& x) const;
    ecc::AffinePoint calculate_u(const SM2KeyExchangePublicParameters& peer) const;
    ByteVec derive_key(const Agreement& a, long k_len);
    ByteVec inner_hash(const Agreement& a, const ecc::AffinePoint& eph_initiator,
                       const ecc::AffinePoint& eph_responder);
    ByteVec confirmation(uint8_t prefix, const ecc::AffinePoint& U, const ByteVec& inner);

    DigestPtr digest_;
    std::optional<SM2KeyExchangePrivateParameters> params_;
    ByteVec user_id_;
    long w_ = 0;
};

} // namespace sm2
} // namespace gmsm

#endif // GMSM_CRYPTO_SM_SM2_KEY_EXCHANGE_H
