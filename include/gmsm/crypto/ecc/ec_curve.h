/**
 * @file ec_curve.h
 * @brief Short Weierstrass curves over Fp: points, group law, encodings
 *
 * Curve y^2 = x^3 + ax + b (mod p). Two plain point representations:
 * - AffinePoint: the public, normalized form (x, y) or infinity
 * - JacobianPoint: internal (X : Y : Z) form, (x, y) = (X/Z^2, Y/Z^3)
 *
 * Points are value types without behaviour; the ECCurve they belong to owns
 * the group law, validation and serialization.
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#ifndef GMSM_CRYPTO_ECC_EC_CURVE_H
#define GMSM_CRYPTO_ECC_EC_CURVE_H

#include "gmsm/core/types.h"
#include "gmsm/math/field_element.h"

#include <NTL/ZZ.h>

#include <memory>
#include <string>

namespace gmsm {
namespace ecc {

using NTL::ZZ;
using math::FieldElement;
using math::PrimeField;
using math::PrimeFieldPtr;

// ============================================================================
// Curve Parameters
// ============================================================================

/**
 * @brief Raw parameters of a curve in short Weierstrass form
 */
struct CurveParams {
    ZZ p;               // Prime modulus
    ZZ a;               // Curve coefficient a
    ZZ b;               // Curve coefficient b
    ZZ n;               // Order of the base point G
    ZZ h;               // Cofactor
    ZZ Gx;              // Base point x-coordinate
    ZZ Gy;              // Base point y-coordinate
    std::string name;
};

/**
 * @brief SM2 recommended curve (sm2p256v1, GM/T 0003.5)
 */
CurveParams sm2_curve_params();

// ============================================================================
// Point Representations
// ============================================================================

/**
 * @brief Normalized point, or the point at infinity
 */
struct AffinePoint {
    FieldElement x;
    FieldElement y;
    bool infinity;

    AffinePoint() : infinity(true) {}

    AffinePoint(const FieldElement& x_, const FieldElement& y_)
        : x(x_), y(y_), infinity(false) {}

    bool is_infinity() const { return infinity; }

    bool operator==(const AffinePoint& other) const {
        if (infinity && other.infinity) return true;
        if (infinity || other.infinity) return false;
        return (x == other.x) && (y == other.y);
    }

    bool operator!=(const AffinePoint& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Jacobian projective coordinates (X : Y : Z), canonical mod p
 *
 * Infinity is any triple with Z = 0; the default is (0 : 1 : 0).
 */
struct JacobianPoint {
    ZZ X;
    ZZ Y;
    ZZ Z;

    JacobianPoint() : X(0), Y(1), Z(0) {}

    JacobianPoint(const ZZ& X_, const ZZ& Y_, const ZZ& Z_)
        : X(X_), Y(Y_), Z(Z_) {}

    bool is_infinity() const { return NTL::IsZero(Z); }
};

// ============================================================================
// Elliptic Curve
// ============================================================================

/**
 * @brief Curve instance: field, coefficients, base point, order, cofactor
 *
 * Immutable after construction and safe to share between threads.
 */
class ECCurve {
public:
    /**
     * @brief Build a curve and check its parameters
     * @throws MathDomainError if 4a^3 + 27b^2 = 0 (mod p)
     * @throws InvalidPointError if (Gx, Gy) is not on the curve
     * @throws std::invalid_argument for a non-positive order or cofactor
     */
    explicit ECCurve(const CurveParams& params);

    // ========================================================================
    // Getters
    // ========================================================================

    const PrimeFieldPtr& field() const { return field_; }
    const ZZ& get_prime() const { return field_->modulus(); }
    const FieldElement& get_a() const { return a_; }
    const FieldElement& get_b() const { return b_; }
    const ZZ& get_order() const { return n_; }
    const ZZ& get_cofactor() const { return h_; }
    const AffinePoint& get_generator() const { return G_; }
    const std::string& get_name() const { return name_; }

    /** Bit length of p */
    long field_size() const { return field_->bit_length(); }

    /** Bytes per encoded coordinate */
    size_t coordinate_size() const { return field_->byte_length(); }

    /** 1 + 2*coordinate_size() uncompressed, 1 + coordinate_size() compressed */
    size_t encoded_point_size(bool compressed) const;

    // ========================================================================
    // Point Construction & Validation
    // ========================================================================

    AffinePoint infinity() const { return AffinePoint(); }

    /**
     * @brief Create a point from affine coordinates
     * @throws InvalidPointError if (x, y) is not on the curve or out of range
     */
    AffinePoint create_point(const ZZ& x, const ZZ& y) const;

    /**
     * @brief Create a point without the curve equation check
     *
     * Coordinates are still reduced mod p. For points produced by the
     * group law itself.
     */
    AffinePoint create_point_unchecked(const ZZ& x, const ZZ& y) const;

    /** @return true if P satisfies the curve equation or is infinity */
    bool is_on_curve(const AffinePoint& P) const;

    /**
     * @brief Full validation for use as a public key or peer point
     *
     * P is not infinity, lies on the curve, and [n]P = infinity.
     */
    bool validate_point(const AffinePoint& P) const;

    // ========================================================================
    // Group Law (affine facade)
    // ========================================================================

    AffinePoint add(const AffinePoint& P, const AffinePoint& Q) const;
    AffinePoint double_point(const AffinePoint& P) const;
    AffinePoint negate(const AffinePoint& P) const;
    AffinePoint subtract(const AffinePoint& P, const AffinePoint& Q) const;

    // ========================================================================
    // Group Law (Jacobian, used by the multipliers)
    // ========================================================================

    /**
     * @brief R = P + Q
     *
     * Handles P = O, Q = O, P = Q (doubling) and P = -Q (infinity).
     */
    JacobianPoint add(const JacobianPoint& P, const JacobianPoint& Q) const;

    JacobianPoint double_point(const JacobianPoint& P) const;
    JacobianPoint negate(const JacobianPoint& P) const;

    /** Projective equality without normalizing either side */
    bool equals(const JacobianPoint& P, const JacobianPoint& Q) const;

    JacobianPoint to_jacobian(const AffinePoint& P) const;

    /**
     * @brief Jacobian to affine, one inversion of Z
     *
     * Z = 0 maps to the canonical infinity value.
     */
    AffinePoint normalize(const JacobianPoint& P) const;

    // ========================================================================
    // Serialization
    // ========================================================================

    /**
     * @brief Encode a point (SEC1 / GM/T 0003.1 section 4.2.8)
     *
     * Infinity: 00. Uncompressed: 04 || X || Y. Compressed: 02|03 || X.
     */
    ByteVec encode_point(const AffinePoint& P, bool compressed = false) const;

    /**
     * @brief Decode any of the three encodings
     * @throws InvalidPointError on malformed input or off-curve result
     */
    AffinePoint decode_point(const uint8_t* in, size_t in_len) const;

    AffinePoint decode_point(const ByteVec& in) const {
        return decode_point(in.data(), in.size());
    }

    bool operator==(const ECCurve& other) const;
    bool operator!=(const ECCurve& other) const { return !(*this == other); }

private:
    PrimeFieldPtr field_;
    FieldElement a_;
    FieldElement b_;
    ZZ n_;
    ZZ h_;
    AffinePoint G_;
    std::string name_;
};

using ECCurvePtr = std::shared_ptr<const ECCurve>;

} // namespace ecc
} // namespace gmsm

#endif // GMSM_CRYPTO_ECC_EC_CURVE_H
