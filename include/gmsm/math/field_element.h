/**
 * @file field_element.h
 * @brief Prime field Fp arithmetic over NTL::ZZ with an explicit modulus
 *
 * NTL::ZZ_p keeps its modulus in thread-local global state. The curve code
 * here never touches that state: every operation takes its modulus from the
 * PrimeField it belongs to, so independent fields can coexist freely.
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#ifndef GMSM_MATH_FIELD_ELEMENT_H
#define GMSM_MATH_FIELD_ELEMENT_H

#include "gmsm/core/types.h"

#include <NTL/ZZ.h>

#include <memory>
#include <optional>

namespace gmsm {
namespace math {

using NTL::ZZ;

// ============================================================================
// Big-endian conversions (NTL works little-endian)
// ============================================================================

/**
 * @brief Interpret big-endian bytes as a non-negative integer
 */
ZZ zz_from_bytes_be(const uint8_t* data, size_t len);

/**
 * @brief Write a non-negative integer as exactly len big-endian bytes
 *
 * High-order bytes that do not fit are dropped; callers size len from the
 * modulus they reduced by.
 */
void zz_to_bytes_be(const ZZ& value, uint8_t* out, size_t len);

ByteVec zz_to_bytes_be(const ZZ& value, size_t len);

// ============================================================================
// PrimeField
// ============================================================================

/**
 * @brief Arithmetic modulo an odd prime p
 *
 * Inputs to the arithmetic methods must already be canonical ([0, p));
 * reduce() brings arbitrary integers there. Outputs are always canonical.
 */
class PrimeField {
public:
    /**
     * @param p Odd prime modulus (primality is the caller's responsibility)
     * @throws std::invalid_argument if p < 3 or p is even
     */
    explicit PrimeField(const ZZ& p);

    const ZZ& modulus() const { return p_; }
    long bit_length() const { return bits_; }
    size_t byte_length() const { return bytes_; }

    ZZ reduce(const ZZ& a) const;

    ZZ add(const ZZ& a, const ZZ& b) const;
    ZZ sub(const ZZ& a, const ZZ& b) const;
    ZZ mul(const ZZ& a, const ZZ& b) const;
    ZZ sqr(const ZZ& a) const;
    ZZ neg(const ZZ& a) const;

    /**
     * @brief Multiplicative inverse
     * @throws MathDomainError when a is zero
     */
    ZZ inv(const ZZ& a) const;

    /**
     * @brief Square root, if a is a quadratic residue
     * @return false when no root exists
     */
    bool sqrt(ZZ& root, const ZZ& a) const;

    /**
     * @brief Fixed-width big-endian encoding (byte_length() bytes)
     */
    void encode(const ZZ& a, uint8_t* out) const;

    /**
     * @brief Decode big-endian bytes, rejecting values >= p
     * @throws std::invalid_argument on out-of-range input or wrong length
     */
    ZZ decode(const uint8_t* data, size_t len) const;

    bool operator==(const PrimeField& other) const { return p_ == other.p_; }
    bool operator!=(const PrimeField& other) const { return !(*this == other); }

private:
    ZZ p_;
    long bits_;
    size_t bytes_;
};

using PrimeFieldPtr = std::shared_ptr<const PrimeField>;

// ============================================================================
// FieldElement
// ============================================================================

/**
 * @brief Immutable canonical element of Fp
 *
 * A default-constructed element is unbound (no field) and only serves as a
 * placeholder, e.g. the coordinates of the point at infinity. Mixing
 * elements of different fields throws std::invalid_argument.
 */
class FieldElement {
public:
    FieldElement() = default;
    FieldElement(PrimeFieldPtr field, const ZZ& value);

    static FieldElement from_bytes(PrimeFieldPtr field, const uint8_t* data, size_t len);

    const ZZ& value() const { return value_; }
    const PrimeFieldPtr& field() const { return field_; }
    bool is_bound() const { return static_cast<bool>(field_); }

    bool is_zero() const { return NTL::IsZero(value_); }
    bool is_odd() const { return NTL::IsOdd(value_) != 0; }

    FieldElement operator+(const FieldElement& rhs) const;
    FieldElement operator-(const FieldElement& rhs) const;
    FieldElement operator*(const FieldElement& rhs) const;
    FieldElement operator-() const { return negate(); }

    FieldElement square() const;
    FieldElement negate() const;

    /** @throws MathDomainError for the zero element */
    FieldElement invert() const;

    std::optional<FieldElement> sqrt() const;

    void encode(uint8_t* out) const;
    ByteVec encode() const;

    bool operator==(const FieldElement& other) const;
    bool operator!=(const FieldElement& other) const { return !(*this == other); }

private:
    const PrimeField& checked_field() const;
    void require_same_field(const FieldElement& other) const;

    PrimeFieldPtr field_;
    ZZ value_;
};

} // namespace math
} // namespace gmsm

#endif // GMSM_MATH_FIELD_ELEMENT_H
