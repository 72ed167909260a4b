/**
 * @file sm2_util.cpp
 * @brief SM2 Z-value and key derivation function
 *
 * GM/T 0003.2 section 5.5 (Z) and GM/T 0003.3 section 5.4.3 (KDF).
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#include "gmsm/crypto/sm/sm2_util.h"
#include "gmsm/core/security.h"
#include "gmsm/utils/encoding.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace gmsm {
namespace sm2 {

const char* const DEFAULT_USER_ID = "1234567812345678";

ByteVec default_user_id() {
    return ByteVec(DEFAULT_USER_ID, DEFAULT_USER_ID + std::strlen(DEFAULT_USER_ID));
}

void add_field_element(Digest& digest, const math::FieldElement& value) {
    ByteVec bytes = value.encode();
    digest.update(bytes);
}

// ============================================================================
// Z value
// ============================================================================

ByteVec compute_z(Digest& digest, const ByteVec& user_id,
                  const ecc::DomainParameters& domain, const ecc::AffinePoint& Q) {
    if (user_id.size() > MAX_USER_ID_LENGTH) {
        throw std::invalid_argument("SM2 user ID too long for ENTL");
    }
    if (Q.is_infinity()) {
        throw std::invalid_argument("compute_z: public point is infinity");
    }

    digest.reset();

    const size_t bits = user_id.size() * 8;
    digest.update(static_cast<uint8_t>((bits >> 8) & 0xFF));
    digest.update(static_cast<uint8_t>(bits & 0xFF));
    digest.update(user_id);

    const ecc::ECCurve& curve = domain.curve();
    add_field_element(digest, curve.get_a());
    add_field_element(digest, curve.get_b());
    add_field_element(digest, domain.G().x);
    add_field_element(digest, domain.G().y);
    add_field_element(digest, Q.x);
    add_field_element(digest, Q.y);

    return digest.do_final();
}

// ============================================================================
// KDF
// ============================================================================

void kdf_from_state(Digest& digest, uint8_t* out, size_t out_len) {
    const size_t v = digest.digest_size();
    const size_t blocks = (out_len + v - 1) / v;
    if (blocks > 0xFFFFFFFFULL) {
        throw std::invalid_argument("KDF output length too large");
    }

    std::unique_ptr<Digest> prefix = digest.clone();
    ByteVec buf(v);
    uint8_t ct_bytes[4];
    size_t off = 0;
    uint32_t ct = 0;

    while (off < out_len) {
        digest.restore(*prefix);
        gmsm_store32_be(ct_bytes, ++ct);
        digest.update(ct_bytes, sizeof(ct_bytes));
        digest.do_final(buf.data());

        const size_t n = std::min(v, out_len - off);
        std::memcpy(out + off, buf.data(), n);
        off += n;
    }

    gmsm_secure_zero(buf.data(), buf.size());
    digest.reset();
}

ByteVec kdf(Digest& digest, const uint8_t* z, size_t z_len, size_t out_len) {
    ByteVec out(out_len);
    digest.reset();
    digest.update(z, z_len);
    kdf_from_state(digest, out.data(), out_len);
    return out;
}

} // namespace sm2
} // namespace gmsm
