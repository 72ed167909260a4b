/**
 * @file ec_multiplier.cpp
 * @brief Double-and-add, fixed-base comb and Shamir's trick
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#include "gmsm/crypto/ecc/ec_multiplier.h"

#include <algorithm>
#include <stdexcept>

#ifndef GMSM_COMB_WIDTH
#define GMSM_COMB_WIDTH 0
#endif

namespace gmsm {
namespace ecc {

// ============================================================================
// Free functions
// ============================================================================

JacobianPoint multiply_double_and_add(const ECCurve& curve, const JacobianPoint& P,
                                      const ZZ& k) {
    if (k < 0) {
        throw std::invalid_argument("scalar multiplication: negative scalar");
    }
    if (NTL::IsZero(k) || P.is_infinity()) {
        return JacobianPoint();
    }

    JacobianPoint R;
    for (long i = NTL::NumBits(k) - 1; i >= 0; i--) {
        R = curve.double_point(R);
        if (NTL::bit(k, i)) {
            R = curve.add(R, P);
        }
    }
    return R;
}

AffinePoint sum_of_two_multiplies(const ECCurve& curve,
                                  const AffinePoint& P, const ZZ& a,
                                  const AffinePoint& Q, const ZZ& b) {
    if (a < 0 || b < 0) {
        throw std::invalid_argument("sum_of_two_multiplies: negative scalar");
    }

    const JacobianPoint jP = curve.to_jacobian(P);
    const JacobianPoint jQ = curve.to_jacobian(Q);
    const JacobianPoint jPQ = curve.add(jP, jQ);

    JacobianPoint R;
    long bits = std::max(NTL::NumBits(a), NTL::NumBits(b));
    for (long i = bits - 1; i >= 0; i--) {
        R = curve.double_point(R);
        const long ba = NTL::bit(a, i);
        const long bb = NTL::bit(b, i);
        if (ba && bb) {
            R = curve.add(R, jPQ);
        } else if (ba) {
            R = curve.add(R, jP);
        } else if (bb) {
            R = curve.add(R, jQ);
        }
    }
    return curve.normalize(R);
}

// ============================================================================
// ECMultiplier
// ============================================================================

ECMultiplier::ECMultiplier(ECCurvePtr curve) : curve_(std::move(curve)) {
    if (!curve_) {
        throw std::invalid_argument("ECMultiplier: null curve");
    }
}

AffinePoint ECMultiplier::multiply(const AffinePoint& P, const ZZ& k) const {
    if (k < 0) {
        throw std::invalid_argument("scalar multiplication: negative scalar");
    }
    if (NTL::IsZero(k) || P.is_infinity()) {
        return AffinePoint();
    }
    return curve_->normalize(multiply_positive(P, k));
}

// ============================================================================
// SimpleECMultiplier
// ============================================================================

SimpleECMultiplier::SimpleECMultiplier(ECCurvePtr curve)
    : ECMultiplier(std::move(curve)) {}

JacobianPoint SimpleECMultiplier::multiply_positive(const AffinePoint& P, const ZZ& k) const {
    return multiply_double_and_add(*curve_, curve_->to_jacobian(P), k);
}

// ============================================================================
// FixedPointCombMultiplier
// ============================================================================

FixedPointCombMultiplier::FixedPointCombMultiplier(ECCurvePtr curve, const AffinePoint& base,
                                                   long width)
    : ECMultiplier(std::move(curve)), base_(base) {
    if (base_.is_infinity()) {
        throw std::invalid_argument("FixedPointCombMultiplier: base point is infinity");
    }

    comb_bits_ = NTL::NumBits(curve_->get_order());

    if (width == 0) {
        width = GMSM_COMB_WIDTH;
    }
    if (width == 0) {
        width = (comb_bits_ > 250) ? 6 : 5;
    }
    if (width < 2 || width > 8) {
        throw std::invalid_argument("FixedPointCombMultiplier: width must be in [2, 8]");
    }
    width_ = width;
    spacing_ = (comb_bits_ + width_ - 1) / width_;

    // pow2[j] = [2^(j*d)]B
    std::vector<JacobianPoint> pow2(static_cast<size_t>(width_));
    pow2[0] = curve_->to_jacobian(base_);
    for (long j = 1; j < width_; j++) {
        JacobianPoint T = pow2[static_cast<size_t>(j - 1)];
        for (long s = 0; s < spacing_; s++) {
            T = curve_->double_point(T);
        }
        pow2[static_cast<size_t>(j)] = T;
    }

    // T[i] = T[i - top] + pow2[log2(top)] where top is the highest set bit of i
    const size_t table_size = static_cast<size_t>(1) << width_;
    table_.assign(table_size, JacobianPoint());
    for (long j = 0; j < width_; j++) {
        const size_t top = static_cast<size_t>(1) << j;
        for (size_t i = top; i < (top << 1); i++) {
            table_[i] = curve_->add(table_[i - top], pow2[static_cast<size_t>(j)]);
        }
    }

    // Store entries with Z = 1 so equal multiples compare and add cheaply
    for (auto& entry : table_) {
        entry = curve_->to_jacobian(curve_->normalize(entry));
    }
}

JacobianPoint FixedPointCombMultiplier::multiply_positive(const AffinePoint& P, const ZZ& k) const {
    if (P != base_) {
        throw std::invalid_argument("FixedPointCombMultiplier: point is not the fixed base");
    }
    if (NTL::NumBits(k) > comb_bits_) {
        throw std::invalid_argument("FixedPointCombMultiplier: scalar wider than comb size");
    }

    JacobianPoint R;
    for (long i = spacing_ - 1; i >= 0; i--) {
        R = curve_->double_point(R);

        size_t index = 0;
        for (long j = width_ - 1; j >= 0; j--) {
            index = (index << 1) | static_cast<size_t>(NTL::bit(k, j * spacing_ + i));
        }
        if (index != 0) {
            R = curve_->add(R, table_[index]);
        }
    }
    return R;
}

} // namespace ecc
} // namespace gmsm
