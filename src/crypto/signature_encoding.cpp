/**
 * @file signature_encoding.cpp
 * @brief DER and plain (r, s) encodings
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#include "gmsm/crypto/signature_encoding.h"
#include "gmsm/core/errors.h"
#include "gmsm/math/field_element.h"

namespace gmsm {

namespace {

constexpr uint8_t DER_SEQUENCE = 0x30;
constexpr uint8_t DER_INTEGER = 0x02;

void check_range(const ZZ& n, const ZZ& v, const char* name) {
    if (v <= 0 || v >= n) {
        throw SignatureRangeError(std::string(name) + " component out of range [1, n-1]");
    }
}

void append_length(ByteVec& out, size_t len) {
    if (len < 0x80) {
        out.push_back(static_cast<uint8_t>(len));
    } else if (len <= 0xFF) {
        out.push_back(0x81);
        out.push_back(static_cast<uint8_t>(len));
    } else {
        out.push_back(0x82);
        out.push_back(static_cast<uint8_t>(len >> 8));
        out.push_back(static_cast<uint8_t>(len));
    }
}

void append_integer(ByteVec& out, const ZZ& v) {
    size_t nbytes = static_cast<size_t>(NTL::NumBytes(v));
    ByteVec body = math::zz_to_bytes_be(v, nbytes);
    if (body[0] & 0x80) {
        body.insert(body.begin(), 0x00);  // keep it positive
    }
    out.push_back(DER_INTEGER);
    append_length(out, body.size());
    out.insert(out.end(), body.begin(), body.end());
}

/** Parse a DER length at pos, advancing pos; only minimal definite forms */
size_t parse_length(const uint8_t* data, size_t len, size_t& pos) {
    if (pos >= len) {
        throw SignatureFormatError("DER: truncated length");
    }
    uint8_t first = data[pos++];
    if (first < 0x80) {
        return first;
    }

    size_t count = first & 0x7F;
    if (count == 0 || count > 2) {
        throw SignatureFormatError("DER: unsupported length form");
    }
    if (pos + count > len) {
        throw SignatureFormatError("DER: truncated length");
    }
    size_t value = 0;
    for (size_t i = 0; i < count; i++) {
        value = (value << 8) | data[pos++];
    }
    if (value < 0x80 || (count == 2 && value <= 0xFF)) {
        throw SignatureFormatError("DER: non-minimal length");
    }
    return value;
}

ZZ parse_integer(const uint8_t* data, size_t len, size_t& pos) {
    if (pos >= len || data[pos] != DER_INTEGER) {
        throw SignatureFormatError("DER: expected INTEGER");
    }
    pos++;
    size_t ilen = parse_length(data, len, pos);
    if (ilen == 0 || pos + ilen > len) {
        throw SignatureFormatError("DER: bad INTEGER length");
    }
    const uint8_t* body = data + pos;
    if (body[0] & 0x80) {
        throw SignatureFormatError("DER: negative INTEGER");
    }
    if (ilen > 1 && body[0] == 0x00 && (body[1] & 0x80) == 0) {
        throw SignatureFormatError("DER: non-minimal INTEGER");
    }
    pos += ilen;
    return math::zz_from_bytes_be(body, ilen);
}

} // namespace

// ============================================================================
// StandardDSAEncoding
// ============================================================================

ByteVec StandardDSAEncoding::encode(const ZZ& n, const ZZ& r, const ZZ& s) const {
    check_range(n, r, "r");
    check_range(n, s, "s");

    ByteVec body;
    append_integer(body, r);
    append_integer(body, s);

    ByteVec out;
    out.reserve(body.size() + 4);
    out.push_back(DER_SEQUENCE);
    append_length(out, body.size());
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

std::pair<ZZ, ZZ> StandardDSAEncoding::decode(const ZZ& n, const uint8_t* data, size_t len) const {
    if (data == nullptr || len < 2) {
        throw SignatureFormatError("DER: signature too short");
    }

    size_t pos = 0;
    if (data[pos++] != DER_SEQUENCE) {
        throw SignatureFormatError("DER: expected SEQUENCE");
    }
    size_t seq_len = parse_length(data, len, pos);
    if (pos + seq_len != len) {
        throw SignatureFormatError("DER: SEQUENCE length does not match input");
    }

    ZZ r = parse_integer(data, len, pos);
    ZZ s = parse_integer(data, len, pos);
    if (pos != len) {
        throw SignatureFormatError("DER: trailing data after signature");
    }

    check_range(n, r, "r");
    check_range(n, s, "s");
    return {r, s};
}

// ============================================================================
// PlainDSAEncoding
// ============================================================================

ByteVec PlainDSAEncoding::encode(const ZZ& n, const ZZ& r, const ZZ& s) const {
    check_range(n, r, "r");
    check_range(n, s, "s");

    const size_t width = static_cast<size_t>(NTL::NumBytes(n));
    ByteVec out(2 * width);
    math::zz_to_bytes_be(r, out.data(), width);
    math::zz_to_bytes_be(s, out.data() + width, width);
    return out;
}

std::pair<ZZ, ZZ> PlainDSAEncoding::decode(const ZZ& n, const uint8_t* data, size_t len) const {
    const size_t width = static_cast<size_t>(NTL::NumBytes(n));
    if (data == nullptr || len != 2 * width) {
        throw SignatureFormatError("plain signature must be exactly 2 * |n| bytes");
    }
    ZZ r = math::zz_from_bytes_be(data, width);
    ZZ s = math::zz_from_bytes_be(data + width, width);
    check_range(n, r, "r");
    check_range(n, s, "s");
    return {r, s};
}

} // namespace gmsm
