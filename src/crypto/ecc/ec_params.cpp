/**
 * @file ec_params.cpp
 * @brief Domain parameters, key parameters and key generation
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#include "gmsm/crypto/ecc/ec_params.h"
#include "gmsm/core/errors.h"
#include "gmsm/math/field_element.h"

#include <stdexcept>

namespace gmsm {
namespace ecc {

// ============================================================================
// DomainParameters
// ============================================================================

DomainParameters::DomainParameters(ECCurvePtr curve, const AffinePoint& G,
                                   const ZZ& n, const ZZ& h)
    : curve_(std::move(curve)), G_(G), n_(n), h_(h) {
    if (!curve_) {
        throw std::invalid_argument("DomainParameters: null curve");
    }
    if (n_ <= 1 || h_ <= 0) {
        throw std::invalid_argument("DomainParameters: invalid order or cofactor");
    }
    if (G_.is_infinity() || !curve_->is_on_curve(G_)) {
        throw std::invalid_argument("DomainParameters: base point not on curve");
    }

    point_multiplier_ = std::make_shared<const SimpleECMultiplier>(curve_);
    if (!point_multiplier_->multiply(G_, n_).is_infinity()) {
        throw std::invalid_argument("DomainParameters: [n]G is not the identity");
    }
    base_multiplier_ = std::make_shared<const FixedPointCombMultiplier>(curve_, G_);
}

bool DomainParameters::operator==(const DomainParameters& other) const {
    if (this == &other) return true;
    return *curve_ == *other.curve_ && G_ == other.G_ && n_ == other.n_ && h_ == other.h_;
}

DomainParametersPtr make_sm2_domain() {
    CurveParams params = sm2_curve_params();
    auto curve = std::make_shared<const ECCurve>(params);
    return std::make_shared<const DomainParameters>(curve, curve->get_generator(),
                                                    params.n, params.h);
}

// ============================================================================
// Validation helpers
// ============================================================================

bool is_valid_private_scalar(const DomainParameters& domain, const ZZ& d) {
    return d >= 1 && d < domain.n();
}

bool is_valid_public_point(const DomainParameters& domain, const AffinePoint& Q) {
    if (Q.is_infinity() || !domain.curve().is_on_curve(Q)) {
        return false;
    }
    return domain.multiply(Q, domain.n()).is_infinity();
}

// ============================================================================
// ECPrivateKeyParameters
// ============================================================================

ECPrivateKeyParameters::ECPrivateKeyParameters(DomainParametersPtr domain, const ZZ& d)
    : domain_(std::move(domain)), d_(d) {
    if (!domain_) {
        throw std::invalid_argument("ECPrivateKeyParameters: null domain");
    }
    if (!is_valid_private_scalar(*domain_, d_)) {
        throw InvalidKeyError("private key scalar out of range [1, n-1]");
    }
}

ECPrivateKeyParameters ECPrivateKeyParameters::decode(DomainParametersPtr domain,
                                                      const uint8_t* data, size_t len) {
    if (!domain) {
        throw std::invalid_argument("ECPrivateKeyParameters: null domain");
    }
    if (data == nullptr || len != domain->curve().coordinate_size()) {
        throw InvalidKeyError("private key encoding has wrong length");
    }
    return ECPrivateKeyParameters(std::move(domain), math::zz_from_bytes_be(data, len));
}

AffinePoint ECPrivateKeyParameters::public_point() const {
    return domain_->multiply_base(d_);
}

ByteVec ECPrivateKeyParameters::encode() const {
    return math::zz_to_bytes_be(d_, domain_->curve().coordinate_size());
}

// ============================================================================
// ECPublicKeyParameters
// ============================================================================

ECPublicKeyParameters::ECPublicKeyParameters(DomainParametersPtr domain, const AffinePoint& Q)
    : domain_(std::move(domain)), Q_(Q) {
    if (!domain_) {
        throw std::invalid_argument("ECPublicKeyParameters: null domain");
    }
    if (!is_valid_public_point(*domain_, Q_)) {
        throw InvalidKeyError("public key point failed validation");
    }
}

ECPublicKeyParameters ECPublicKeyParameters::decode(DomainParametersPtr domain,
                                                    const uint8_t* data, size_t len) {
    if (!domain) {
        throw std::invalid_argument("ECPublicKeyParameters: null domain");
    }
    AffinePoint Q;
    try {
        Q = domain->curve().decode_point(data, len);
    } catch (const InvalidPointError& e) {
        throw InvalidKeyError(std::string("public key: ") + e.what());
    }
    return ECPublicKeyParameters(std::move(domain), Q);
}

ByteVec ECPublicKeyParameters::encode(bool compressed) const {
    return domain_->curve().encode_point(Q_, compressed);
}

// ============================================================================
// Key generation
// ============================================================================

ECKeyPair generate_key_pair(const DomainParametersPtr& domain, RandomSource& random) {
    if (!domain) {
        throw std::invalid_argument("generate_key_pair: null domain");
    }
    // random_scalar(n - 1) yields [1, n-2]
    ZZ d = random_scalar(random, domain->n() - 1);
    ECPrivateKeyParameters priv(domain, d);
    ECPublicKeyParameters pub(domain, priv.public_point());
    NTL::clear(d);
    return ECKeyPair{priv, pub};
}

} // namespace ecc
} // namespace gmsm
