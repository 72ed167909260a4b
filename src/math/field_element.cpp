/**
 * @file field_element.cpp
 * @brief Prime field arithmetic with explicit modulus
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#include "gmsm/math/field_element.h"
#include "gmsm/core/errors.h"

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace gmsm {
namespace math {

// ============================================================================
// Byte conversions
// ============================================================================

ZZ zz_from_bytes_be(const uint8_t* data, size_t len) {
    ZZ result;
    if (data == nullptr || len == 0) {
        return result;
    }
    std::vector<uint8_t> le(data, data + len);
    std::reverse(le.begin(), le.end());
    NTL::ZZFromBytes(result, le.data(), static_cast<long>(len));
    return result;
}

void zz_to_bytes_be(const ZZ& value, uint8_t* out, size_t len) {
    if (len == 0) return;
    NTL::BytesFromZZ(out, value, static_cast<long>(len));
    std::reverse(out, out + len);
}

ByteVec zz_to_bytes_be(const ZZ& value, size_t len) {
    ByteVec out(len);
    zz_to_bytes_be(value, out.data(), len);
    return out;
}

// ============================================================================
// PrimeField
// ============================================================================

PrimeField::PrimeField(const ZZ& p) : p_(p) {
    if (p_ < 3 || !NTL::IsOdd(p_)) {
        throw std::invalid_argument("PrimeField: modulus must be an odd prime");
    }
    bits_ = NTL::NumBits(p_);
    bytes_ = static_cast<size_t>((bits_ + 7) / 8);
}

ZZ PrimeField::reduce(const ZZ& a) const {
    ZZ r;
    NTL::rem(r, a, p_);  // sign follows p, so r is in [0, p)
    return r;
}

ZZ PrimeField::add(const ZZ& a, const ZZ& b) const {
    ZZ r;
    NTL::AddMod(r, a, b, p_);
    return r;
}

ZZ PrimeField::sub(const ZZ& a, const ZZ& b) const {
    ZZ r;
    NTL::SubMod(r, a, b, p_);
    return r;
}

ZZ PrimeField::mul(const ZZ& a, const ZZ& b) const {
    ZZ r;
    NTL::MulMod(r, a, b, p_);
    return r;
}

ZZ PrimeField::sqr(const ZZ& a) const {
    ZZ r;
    NTL::SqrMod(r, a, p_);
    return r;
}

ZZ PrimeField::neg(const ZZ& a) const {
    ZZ r;
    NTL::NegateMod(r, a, p_);
    return r;
}

ZZ PrimeField::inv(const ZZ& a) const {
    if (NTL::IsZero(a)) {
        throw MathDomainError("field inversion of zero");
    }
    ZZ r;
    if (NTL::InvModStatus(r, a, p_) != 0) {
        throw MathDomainError("element has no inverse modulo p");
    }
    return r;
}

bool PrimeField::sqrt(ZZ& root, const ZZ& a) const {
    if (NTL::IsZero(a)) {
        NTL::clear(root);
        return true;
    }
    if (NTL::Jacobi(a, p_) != 1) {
        return false;
    }
    ZZ candidate;
    NTL::SqrRootMod(candidate, a, p_);
    if (sqr(candidate) != a) {
        return false;
    }
    root = candidate;
    return true;
}

void PrimeField::encode(const ZZ& a, uint8_t* out) const {
    zz_to_bytes_be(a, out, bytes_);
}

ZZ PrimeField::decode(const uint8_t* data, size_t len) const {
    if (len != bytes_) {
        throw std::invalid_argument("field element encoding has wrong length");
    }
    ZZ v = zz_from_bytes_be(data, len);
    if (v >= p_) {
        throw std::invalid_argument("field element encoding out of range");
    }
    return v;
}

// ============================================================================
// FieldElement
// ============================================================================

FieldElement::FieldElement(PrimeFieldPtr field, const ZZ& value)
    : field_(std::move(field)) {
    if (!field_) {
        throw std::invalid_argument("FieldElement: null field");
    }
    value_ = field_->reduce(value);
}

FieldElement FieldElement::from_bytes(PrimeFieldPtr field, const uint8_t* data, size_t len) {
    if (!field) {
        throw std::invalid_argument("FieldElement: null field");
    }
    ZZ v = field->decode(data, len);
    return FieldElement(std::move(field), v);
}

const PrimeField& FieldElement::checked_field() const {
    if (!field_) {
        throw std::invalid_argument("FieldElement: operation on unbound element");
    }
    return *field_;
}

void FieldElement::require_same_field(const FieldElement& other) const {
    const PrimeField& f = checked_field();
    if (!other.field_ || (other.field_ != field_ && *other.field_ != f)) {
        throw std::invalid_argument("FieldElement: operands from different fields");
    }
}

FieldElement FieldElement::operator+(const FieldElement& rhs) const {
    require_same_field(rhs);
    return FieldElement(field_, field_->add(value_, rhs.value_));
}

FieldElement FieldElement::operator-(const FieldElement& rhs) const {
    require_same_field(rhs);
    return FieldElement(field_, field_->sub(value_, rhs.value_));
}

FieldElement FieldElement::operator*(const FieldElement& rhs) const {
    require_same_field(rhs);
    return FieldElement(field_, field_->mul(value_, rhs.value_));
}

FieldElement FieldElement::square() const {
    return FieldElement(field_, checked_field().sqr(value_));
}

FieldElement FieldElement::negate() const {
    return FieldElement(field_, checked_field().neg(value_));
}

FieldElement FieldElement::invert() const {
    return FieldElement(field_, checked_field().inv(value_));
}

std::optional<FieldElement> FieldElement::sqrt() const {
    ZZ root;
    if (!checked_field().sqrt(root, value_)) {
        return std::nullopt;
    }
    return FieldElement(field_, root);
}

void FieldElement::encode(uint8_t* out) const {
    checked_field().encode(value_, out);
}

ByteVec FieldElement::encode() const {
    ByteVec out(checked_field().byte_length());
    encode(out.data());
    return out;
}

bool FieldElement::operator==(const FieldElement& other) const {
    if (!field_ || !other.field_) {
        return !field_ && !other.field_;
    }
    return *field_ == *other.field_ && value_ == other.value_;
}

} // namespace math
} // namespace gmsm
