/**
 * @file encoding.h
 * @brief Hex and big-endian integer packing helpers
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#ifndef GMSM_UTILS_ENCODING_H
#define GMSM_UTILS_ENCODING_H

#include "gmsm/core/common.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Encode bytes as lowercase hex
 * @param data Input bytes
 * @param len Input length
 * @param hex Output buffer, at least 2*len+1 bytes (NUL terminated)
 * @param hex_size Output buffer size
 * @return Number of hex characters written, 0 on error
 */
GMSM_API size_t gmsm_hex_encode(const uint8_t* data, size_t len, char* hex, size_t hex_size);

/**
 * @brief Decode hex (optional 0x prefix, either case)
 * @param hex Input string
 * @param hex_len Input length, 0 to use strlen
 * @param data Output buffer
 * @param data_size Output buffer size
 * @return Number of bytes written, 0 on error
 */
GMSM_API size_t gmsm_hex_decode(const char* hex, size_t hex_len, uint8_t* data, size_t data_size);

GMSM_API int gmsm_hex_char_value(char c);

/** Store a 32-bit value big-endian */
GMSM_API void gmsm_store32_be(uint8_t out[4], uint32_t value);

#ifdef __cplusplus
}

#include "gmsm/core/types.h"
#include <stdexcept>
#include <string>

namespace gmsm {
namespace encoding {

class EncodingError : public std::runtime_error {
public:
    explicit EncodingError(const std::string& msg) : std::runtime_error(msg) {}
};

std::string hexEncode(const ByteVec& data);
std::string hexEncode(const uint8_t* data, size_t len);

/**
 * @brief Decode hex string
 * @throws EncodingError on odd length or non-hex characters
 */
ByteVec hexDecode(const std::string& hex);

bool isValidHex(const std::string& str) noexcept;

} // namespace encoding
} // namespace gmsm

#endif // __cplusplus

#endif // GMSM_UTILS_ENCODING_H
