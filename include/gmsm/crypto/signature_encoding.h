/**
 * @file signature_encoding.h
 * @brief Serialization of (r, s) signature pairs
 *
 * StandardDSAEncoding: DER SEQUENCE { INTEGER r, INTEGER s }, strict
 * (minimal lengths and integers, no trailing bytes).
 * PlainDSAEncoding: fixed-width r || s, each as wide as n.
 *
 * Both reject r or s outside [1, n-1] on encode and decode.
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#ifndef GMSM_CRYPTO_SIGNATURE_ENCODING_H
#define GMSM_CRYPTO_SIGNATURE_ENCODING_H

#include "gmsm/core/types.h"

#include <NTL/ZZ.h>

#include <memory>
#include <utility>

namespace gmsm {

using NTL::ZZ;

class SignatureEncoding {
public:
    virtual ~SignatureEncoding() = default;

    /** @throws SignatureRangeError if r or s is outside [1, n-1] */
    virtual ByteVec encode(const ZZ& n, const ZZ& r, const ZZ& s) const = 0;

    /**
     * @throws SignatureFormatError on malformed input
     * @throws SignatureRangeError if r or s is outside [1, n-1]
     */
    virtual std::pair<ZZ, ZZ> decode(const ZZ& n, const uint8_t* data, size_t len) const = 0;
};

using SignatureEncodingPtr = std::shared_ptr<const SignatureEncoding>;

class StandardDSAEncoding : public SignatureEncoding {
public:
    ByteVec encode(const ZZ& n, const ZZ& r, const ZZ& s) const override;
    std::pair<ZZ, ZZ> decode(const ZZ& n, const uint8_t* data, size_t len) const override;
};

class PlainDSAEncoding : public SignatureEncoding {
public:
    ByteVec encode(const ZZ& n, const ZZ& r, const ZZ& s) const override;
    std::pair<ZZ, ZZ> decode(const ZZ& n, const uint8_t* data, size_t len) const override;
};

} // namespace gmsm

#endif // GMSM_CRYPTO_SIGNATURE_ENCODING_H
