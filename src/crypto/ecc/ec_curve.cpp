/**
 * @file ec_curve.cpp
 * @brief Curve construction, Jacobian group law and point encodings
 *
 * Formulas from https://hyperelliptic.org/EFD/g1p/auto-shortw-jacobian.html
 * (add-2007-bl style without the Z1=Z2 shortcut, dbl-2007-bl for doubling).
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#include "gmsm/crypto/ecc/ec_curve.h"
#include "gmsm/crypto/ecc/ec_multiplier.h"
#include "gmsm/core/errors.h"

#include <stdexcept>

namespace gmsm {
namespace ecc {

// ============================================================================
// Standard Curve Parameters
// ============================================================================

CurveParams sm2_curve_params() {
    CurveParams params;
    params.name = "sm2p256v1";
    params.p = NTL::conv<ZZ>("115792089210356248756420345214020892766250353991924191454421193933289684991999");
    params.a = NTL::conv<ZZ>("115792089210356248756420345214020892766250353991924191454421193933289684991996");
    params.b = NTL::conv<ZZ>("18505919022281880113072981827955639221458448578012075254857346196103069175443");
    params.n = NTL::conv<ZZ>("115792089210356248756420345214020892766061623724957744567843809356293439045923");
    params.h = ZZ(1);
    params.Gx = NTL::conv<ZZ>("22963146547237050559479531362550074578802567295341616970375194840604139615431");
    params.Gy = NTL::conv<ZZ>("85132369209828568825618990617112496413088388631904505083283536607588877201568");
    return params;
}

// ============================================================================
// Construction
// ============================================================================

ECCurve::ECCurve(const CurveParams& params)
    : field_(std::make_shared<const PrimeField>(params.p)),
      n_(params.n),
      h_(params.h),
      name_(params.name) {
    if (n_ <= 0 || h_ <= 0) {
        throw std::invalid_argument("ECCurve: order and cofactor must be positive");
    }

    a_ = FieldElement(field_, params.a);
    b_ = FieldElement(field_, params.b);

    // Non-singular: 4a^3 + 27b^2 != 0 (mod p)
    const PrimeField& F = *field_;
    ZZ a3 = F.mul(F.sqr(a_.value()), a_.value());
    ZZ b2 = F.sqr(b_.value());
    ZZ disc = F.add(F.mul(F.reduce(ZZ(4)), a3), F.mul(F.reduce(ZZ(27)), b2));
    if (NTL::IsZero(disc)) {
        throw MathDomainError("ECCurve: singular curve (4a^3 + 27b^2 = 0)");
    }

    G_ = create_point(params.Gx, params.Gy);
}

size_t ECCurve::encoded_point_size(bool compressed) const {
    return compressed ? 1 + coordinate_size() : 1 + 2 * coordinate_size();
}

// ============================================================================
// Point Construction & Validation
// ============================================================================

AffinePoint ECCurve::create_point(const ZZ& x, const ZZ& y) const {
    if (x < 0 || y < 0 || x >= get_prime() || y >= get_prime()) {
        throw InvalidPointError("coordinate out of range [0, p)");
    }
    AffinePoint P(FieldElement(field_, x), FieldElement(field_, y));
    if (!is_on_curve(P)) {
        throw InvalidPointError("point is not on the curve");
    }
    return P;
}

AffinePoint ECCurve::create_point_unchecked(const ZZ& x, const ZZ& y) const {
    return AffinePoint(FieldElement(field_, x), FieldElement(field_, y));
}

bool ECCurve::is_on_curve(const AffinePoint& P) const {
    if (P.infinity) return true;
    if (!P.x.is_bound() || !P.y.is_bound()) return false;
    if (*P.x.field() != *field_ || *P.y.field() != *field_) return false;

    // y^2 = x^3 + ax + b (mod p)
    FieldElement lhs = P.y.square();
    FieldElement rhs = P.x.square() * P.x + a_ * P.x + b_;
    return lhs == rhs;
}

bool ECCurve::validate_point(const AffinePoint& P) const {
    if (P.infinity) return false;
    if (!is_on_curve(P)) return false;
    return multiply_double_and_add(*this, to_jacobian(P), n_).is_infinity();
}

// ============================================================================
// Group Law (Jacobian)
// ============================================================================

JacobianPoint ECCurve::add(const JacobianPoint& P, const JacobianPoint& Q) const {
    if (P.is_infinity()) return Q;
    if (Q.is_infinity()) return P;

    const PrimeField& F = *field_;

    ZZ Z1Z1 = F.sqr(P.Z);
    ZZ Z2Z2 = F.sqr(Q.Z);
    ZZ U1 = F.mul(P.X, Z2Z2);
    ZZ U2 = F.mul(Q.X, Z1Z1);
    ZZ S1 = F.mul(F.mul(P.Y, Q.Z), Z2Z2);
    ZZ S2 = F.mul(F.mul(Q.Y, P.Z), Z1Z1);

    ZZ H = F.sub(U2, U1);
    ZZ R = F.sub(S2, S1);

    if (NTL::IsZero(H)) {
        if (NTL::IsZero(R)) {
            return double_point(P);  // P == Q
        }
        return JacobianPoint();      // P == -Q
    }

    ZZ HH = F.sqr(H);
    ZZ HHH = F.mul(H, HH);
    ZZ V = F.mul(U1, HH);

    JacobianPoint result;
    result.X = F.sub(F.sub(F.sqr(R), HHH), F.add(V, V));
    result.Y = F.sub(F.mul(R, F.sub(V, result.X)), F.mul(S1, HHH));
    result.Z = F.mul(F.mul(P.Z, Q.Z), H);
    return result;
}

JacobianPoint ECCurve::double_point(const JacobianPoint& P) const {
    if (P.is_infinity()) return P;
    if (NTL::IsZero(P.Y)) return JacobianPoint();  // tangent is vertical

    const PrimeField& F = *field_;

    ZZ XX = F.sqr(P.X);
    ZZ YY = F.sqr(P.Y);
    ZZ YYYY = F.sqr(YY);
    ZZ ZZ2 = F.sqr(P.Z);

    // S = 2((X + YY)^2 - XX - YYYY)
    ZZ S = F.sub(F.sub(F.sqr(F.add(P.X, YY)), XX), YYYY);
    S = F.add(S, S);

    // M = 3XX + a*ZZ^2
    ZZ M = F.add(F.add(XX, XX), XX);
    M = F.add(M, F.mul(a_.value(), F.sqr(ZZ2)));

    ZZ Y8 = F.add(YYYY, YYYY);
    Y8 = F.add(Y8, Y8);
    Y8 = F.add(Y8, Y8);

    JacobianPoint result;
    result.X = F.sub(F.sqr(M), F.add(S, S));
    result.Y = F.sub(F.mul(M, F.sub(S, result.X)), Y8);
    ZZ YZ = F.mul(P.Y, P.Z);
    result.Z = F.add(YZ, YZ);
    return result;
}

JacobianPoint ECCurve::negate(const JacobianPoint& P) const {
    if (P.is_infinity()) return P;
    return JacobianPoint(P.X, field_->neg(P.Y), P.Z);
}

bool ECCurve::equals(const JacobianPoint& P, const JacobianPoint& Q) const {
    if (P.is_infinity() || Q.is_infinity()) {
        return P.is_infinity() && Q.is_infinity();
    }

    const PrimeField& F = *field_;
    ZZ Z1Z1 = F.sqr(P.Z);
    ZZ Z2Z2 = F.sqr(Q.Z);
    if (F.mul(P.X, Z2Z2) != F.mul(Q.X, Z1Z1)) {
        return false;
    }
    return F.mul(P.Y, F.mul(Q.Z, Z2Z2)) == F.mul(Q.Y, F.mul(P.Z, Z1Z1));
}

JacobianPoint ECCurve::to_jacobian(const AffinePoint& P) const {
    if (P.infinity) {
        return JacobianPoint();
    }
    return JacobianPoint(P.x.value(), P.y.value(), ZZ(1));
}

AffinePoint ECCurve::normalize(const JacobianPoint& P) const {
    if (P.is_infinity()) {
        return AffinePoint();
    }

    const PrimeField& F = *field_;
    if (P.Z == 1) {
        return create_point_unchecked(P.X, P.Y);
    }

    // x = X / Z^2, y = Y / Z^3
    ZZ Z_inv = F.inv(P.Z);
    ZZ Z2_inv = F.sqr(Z_inv);
    ZZ Z3_inv = F.mul(Z2_inv, Z_inv);
    return create_point_unchecked(F.mul(P.X, Z2_inv), F.mul(P.Y, Z3_inv));
}

// ============================================================================
// Group Law (affine facade)
// ============================================================================

AffinePoint ECCurve::add(const AffinePoint& P, const AffinePoint& Q) const {
    return normalize(add(to_jacobian(P), to_jacobian(Q)));
}

AffinePoint ECCurve::double_point(const AffinePoint& P) const {
    return normalize(double_point(to_jacobian(P)));
}

AffinePoint ECCurve::negate(const AffinePoint& P) const {
    if (P.infinity) return P;
    return AffinePoint(P.x, P.y.negate());
}

AffinePoint ECCurve::subtract(const AffinePoint& P, const AffinePoint& Q) const {
    return add(P, negate(Q));
}

// ============================================================================
// Serialization
// ============================================================================

ByteVec ECCurve::encode_point(const AffinePoint& P, bool compressed) const {
    if (P.infinity) {
        return ByteVec(1, 0x00);
    }

    const size_t len = coordinate_size();
    ByteVec out(encoded_point_size(compressed));
    P.x.encode(out.data() + 1);

    if (compressed) {
        out[0] = P.y.is_odd() ? 0x03 : 0x02;
    } else {
        out[0] = 0x04;
        P.y.encode(out.data() + 1 + len);
    }
    return out;
}

AffinePoint ECCurve::decode_point(const uint8_t* in, size_t in_len) const {
    if (in == nullptr || in_len == 0) {
        throw InvalidPointError("empty point encoding");
    }

    const size_t len = coordinate_size();
    const uint8_t type = in[0];

    try {
        switch (type) {
            case 0x00: {
                if (in_len != 1) {
                    throw InvalidPointError("infinity encoding must be a single byte");
                }
                return AffinePoint();
            }
            case 0x02:
            case 0x03: {
                if (in_len != 1 + len) {
                    throw InvalidPointError("compressed point has wrong length");
                }
                FieldElement x = FieldElement::from_bytes(field_, in + 1, len);
                FieldElement rhs = x.square() * x + a_ * x + b_;
                std::optional<FieldElement> y = rhs.sqrt();
                if (!y) {
                    throw InvalidPointError("compressed point: x has no matching y");
                }
                const bool want_odd = (type == 0x03);
                FieldElement y_sel = (y->is_odd() == want_odd) ? *y : y->negate();
                if (y_sel.is_odd() != want_odd) {
                    throw InvalidPointError("compressed point: y parity unavailable");
                }
                return AffinePoint(x, y_sel);
            }
            case 0x04: {
                if (in_len != 1 + 2 * len) {
                    throw InvalidPointError("uncompressed point has wrong length");
                }
                ZZ x = field_->decode(in + 1, len);
                ZZ y = field_->decode(in + 1 + len, len);
                return create_point(x, y);
            }
            default:
                throw InvalidPointError("unknown point encoding prefix");
        }
    } catch (const std::invalid_argument& e) {
        throw InvalidPointError(std::string("point encoding: ") + e.what());
    }
}

bool ECCurve::operator==(const ECCurve& other) const {
    if (this == &other) return true;
    return *field_ == *other.field_ &&
           a_ == other.a_ &&
           b_ == other.b_ &&
           n_ == other.n_ &&
           h_ == other.h_ &&
           G_ == other.G_;
}

} // namespace ecc
} // namespace gmsm
