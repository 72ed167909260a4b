/**
 * @file digest.h
 * @brief Message digest interface with explicit state clone/restore
 *
 * Protocols re-seed a hash from a common prefix many times (KDF counters,
 * the signer's Z-preloaded state). clone() captures the running state and
 * restore() copies a captured state back in; for SM3 both are a copy of a
 * few fixed-size registers.
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#ifndef GMSM_CRYPTO_DIGEST_H
#define GMSM_CRYPTO_DIGEST_H

#include "gmsm/core/types.h"

#include <memory>
#include <string>

namespace gmsm {

class Digest {
public:
    virtual ~Digest() = default;

    virtual std::string algorithm_name() const = 0;

    /** Output size in bytes */
    virtual size_t digest_size() const = 0;

    /** Internal block size in bytes */
    virtual size_t block_size() const = 0;

    virtual void update(const uint8_t* data, size_t len) = 0;

    void update(uint8_t b) { update(&b, 1); }
    void update(const ByteVec& data) { update(data.data(), data.size()); }

    /**
     * @brief Write digest_size() bytes to out and reset to the initial state
     */
    virtual void do_final(uint8_t* out) = 0;

    ByteVec do_final() {
        ByteVec out(digest_size());
        do_final(out.data());
        return out;
    }

    virtual void reset() = 0;

    /** Independent copy of the running state */
    virtual std::unique_ptr<Digest> clone() const = 0;

    /**
     * @brief Overwrite this state with another's
     * @throws std::invalid_argument if other is a different algorithm
     */
    virtual void restore(const Digest& other) = 0;
};

using DigestPtr = std::unique_ptr<Digest>;

} // namespace gmsm

#endif // GMSM_CRYPTO_DIGEST_H
