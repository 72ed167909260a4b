/**
 * @file ec_multiplier.h
 * @brief Scalar multiplication strategies
 *
 * Both strategies compute [k]P for k >= 0 and agree on every input:
 * - SimpleECMultiplier: binary double-and-add for arbitrary points
 * - FixedPointCombMultiplier: Lim-Lee comb over a table precomputed for
 *   one fixed base point (normally G)
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#ifndef GMSM_CRYPTO_ECC_EC_MULTIPLIER_H
#define GMSM_CRYPTO_ECC_EC_MULTIPLIER_H

#include "gmsm/crypto/ecc/ec_curve.h"

#include <memory>
#include <vector>

namespace gmsm {
namespace ecc {

/**
 * @brief Left-to-right double-and-add on Jacobian points
 *
 * No reduction of k: [n]P really is computed, which the subgroup check
 * relies on.
 *
 * @throws std::invalid_argument if k < 0
 */
JacobianPoint multiply_double_and_add(const ECCurve& curve, const JacobianPoint& P,
                                      const ZZ& k);

/**
 * @brief [a]P + [b]Q with one shared doubling chain (Shamir's trick)
 * @throws std::invalid_argument if a or b is negative
 */
AffinePoint sum_of_two_multiplies(const ECCurve& curve,
                                  const AffinePoint& P, const ZZ& a,
                                  const AffinePoint& Q, const ZZ& b);

// ============================================================================
// Multiplier interface
// ============================================================================

class ECMultiplier {
public:
    virtual ~ECMultiplier() = default;

    /**
     * @brief [k]P, normalized
     *
     * k = 0 or P = O gives O; k = 1 gives P.
     *
     * @throws std::invalid_argument if k < 0, or if the strategy cannot
     *         handle P or k (see subclasses)
     */
    AffinePoint multiply(const AffinePoint& P, const ZZ& k) const;

    const ECCurve& curve() const { return *curve_; }

protected:
    explicit ECMultiplier(ECCurvePtr curve);

    /** Called with k >= 1 and P finite */
    virtual JacobianPoint multiply_positive(const AffinePoint& P, const ZZ& k) const = 0;

    ECCurvePtr curve_;
};

using ECMultiplierPtr = std::shared_ptr<const ECMultiplier>;

class SimpleECMultiplier : public ECMultiplier {
public:
    explicit SimpleECMultiplier(ECCurvePtr curve);

protected:
    JacobianPoint multiply_positive(const AffinePoint& P, const ZZ& k) const override;
};

/**
 * @brief Fixed-base comb
 *
 * With comb size m = bits(n), width w and spacing d = ceil(m / w), the
 * table holds T[i] = sum_{j : bit j of i} [2^(j*d)]B for i < 2^w. A scalar
 * then costs d doublings and d table additions.
 */
class FixedPointCombMultiplier : public ECMultiplier {
public:
    /**
     * @param curve Curve the base point lives on
     * @param base Fixed base point (finite, on the curve)
     * @param width Comb width 2..8, or 0 to pick from the comb size
     * @throws std::invalid_argument for infinity base or bad width
     */
    FixedPointCombMultiplier(ECCurvePtr curve, const AffinePoint& base, long width = 0);

    const AffinePoint& base() const { return base_; }
    long width() const { return width_; }
    long comb_size() const { return comb_bits_; }

protected:
    /**
     * @throws std::invalid_argument if P is not the base point or k is
     *         wider than the comb size
     */
    JacobianPoint multiply_positive(const AffinePoint& P, const ZZ& k) const override;

private:
    AffinePoint base_;
    long width_;
    long comb_bits_;
    long spacing_;
    std::vector<JacobianPoint> table_;
};

} // namespace ecc
} // namespace gmsm

#endif // GMSM_CRYPTO_ECC_EC_MULTIPLIER_H
