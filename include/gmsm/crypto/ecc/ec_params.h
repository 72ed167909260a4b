/**
 * @file ec_params.h
 * @brief Domain parameters and EC key parameters
 *
 * DomainParameters is built once (make_sm2_domain()) and shared by pointer
 * with every key, signer, engine and key exchange that uses it. Key
 * parameter objects enforce their invariants on construction, so holding
 * one means holding a valid key:
 * - private: 1 <= d < n
 * - public:  Q finite, on the curve, [n]Q = O
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#ifndef GMSM_CRYPTO_ECC_EC_PARAMS_H
#define GMSM_CRYPTO_ECC_EC_PARAMS_H

#include "gmsm/crypto/ecc/ec_curve.h"
#include "gmsm/crypto/ecc/ec_multiplier.h"
#include "gmsm/crypto/random.h"

#include <memory>
#include <variant>

namespace gmsm {
namespace ecc {

// ============================================================================
// Domain Parameters
// ============================================================================

class DomainParameters {
public:
    /**
     * @throws std::invalid_argument if G is infinity or not on the curve,
     *         or n <= 1, or h <= 0
     */
    DomainParameters(ECCurvePtr curve, const AffinePoint& G, const ZZ& n, const ZZ& h);

    const ECCurve& curve() const { return *curve_; }
    const ECCurvePtr& curve_ptr() const { return curve_; }
    const AffinePoint& G() const { return G_; }
    const ZZ& n() const { return n_; }
    const ZZ& h() const { return h_; }

    /** Comb multiplier bound to G */
    const ECMultiplier& base_multiplier() const { return *base_multiplier_; }

    /** Double-and-add for arbitrary points */
    const ECMultiplier& point_multiplier() const { return *point_multiplier_; }

    AffinePoint multiply_base(const ZZ& k) const { return base_multiplier_->multiply(G_, k); }

    AffinePoint multiply(const AffinePoint& P, const ZZ& k) const {
        return point_multiplier_->multiply(P, k);
    }

    /** Structural: same curve, G, n and h */
    bool operator==(const DomainParameters& other) const;
    bool operator!=(const DomainParameters& other) const { return !(*this == other); }

private:
    ECCurvePtr curve_;
    AffinePoint G_;
    ZZ n_;
    ZZ h_;
    std::shared_ptr<const FixedPointCombMultiplier> base_multiplier_;
    std::shared_ptr<const SimpleECMultiplier> point_multiplier_;
};

using DomainParametersPtr = std::shared_ptr<const DomainParameters>;

/**
 * @brief Build the SM2 domain (curve, comb table for G)
 *
 * Callers construct it once at startup and pass it down.
 */
DomainParametersPtr make_sm2_domain();

// ============================================================================
// Key Parameters
// ============================================================================

class ECPrivateKeyParameters {
public:
    /** @throws InvalidKeyError unless 1 <= d < n */
    ECPrivateKeyParameters(DomainParametersPtr domain, const ZZ& d);

    /**
     * @brief Decode a fixed-width big-endian scalar
     * @throws InvalidKeyError on wrong length or out-of-range value
     */
    static ECPrivateKeyParameters decode(DomainParametersPtr domain,
                                         const uint8_t* data, size_t len);

    const ZZ& d() const { return d_; }
    const DomainParameters& domain() const { return *domain_; }
    const DomainParametersPtr& domain_ptr() const { return domain_; }

    /** Q = [d]G */
    AffinePoint public_point() const;

    ByteVec encode() const;

private:
    DomainParametersPtr domain_;
    ZZ d_;
};

class ECPublicKeyParameters {
public:
    /** @throws InvalidKeyError if Q fails point validation */
    ECPublicKeyParameters(DomainParametersPtr domain, const AffinePoint& Q);

    /**
     * @brief Decode a point encoding into a validated public key
     * @throws InvalidKeyError on malformed or invalid points
     */
    static ECPublicKeyParameters decode(DomainParametersPtr domain,
                                        const uint8_t* data, size_t len);

    const AffinePoint& Q() const { return Q_; }
    const DomainParameters& domain() const { return *domain_; }
    const DomainParametersPtr& domain_ptr() const { return domain_; }

    ByteVec encode(bool compressed = false) const;

private:
    DomainParametersPtr domain_;
    AffinePoint Q_;
};

/** Key material handed to init(); the variant decides signing vs verifying */
using KeyParameters = std::variant<ECPrivateKeyParameters, ECPublicKeyParameters>;

struct ECKeyPair {
    ECPrivateKeyParameters private_key;
    ECPublicKeyParameters public_key;
};

/**
 * @brief Fresh key pair with d uniform in [1, n-2]
 *
 * n-1 is excluded because SM2 signing needs (1 + d) to be invertible.
 */
ECKeyPair generate_key_pair(const DomainParametersPtr& domain, RandomSource& random);

bool is_valid_private_scalar(const DomainParameters& domain, const ZZ& d);

/** Finite, on the curve, [n]Q = O */
bool is_valid_public_point(const DomainParameters& domain, const AffinePoint& Q);

} // namespace ecc
} // namespace gmsm

#endif // GMSM_CRYPTO_ECC_EC_PARAMS_H
