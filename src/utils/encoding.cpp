/**
 * @file encoding.cpp
 * @brief Hex encoding and byte packing
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#include "gmsm/utils/encoding.h"

#include <cstring>

static const char HEX_LOWER[] = "0123456789abcdef";

// ============================================================================
// C API
// ============================================================================

extern "C" {

size_t gmsm_hex_encode(const uint8_t* data, size_t len, char* hex, size_t hex_size) {
    if ((data == nullptr && len > 0) || hex == nullptr || hex_size < len * 2 + 1) {
        return 0;
    }

    for (size_t i = 0; i < len; i++) {
        hex[i * 2] = HEX_LOWER[data[i] >> 4];
        hex[i * 2 + 1] = HEX_LOWER[data[i] & 0x0F];
    }
    hex[len * 2] = '\0';
    return len * 2;
}

int gmsm_hex_char_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

size_t gmsm_hex_decode(const char* hex, size_t hex_len, uint8_t* data, size_t data_size) {
    if (hex == nullptr || data == nullptr) {
        return 0;
    }

    if (hex_len == 0) {
        hex_len = strlen(hex);
    }

    if (hex_len >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex += 2;
        hex_len -= 2;
    }

    if (hex_len % 2 != 0) {
        return 0;
    }

    size_t out_len = hex_len / 2;
    if (data_size < out_len) {
        return 0;
    }

    for (size_t i = 0; i < out_len; i++) {
        int hi = gmsm_hex_char_value(hex[i * 2]);
        int lo = gmsm_hex_char_value(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            return 0;
        }
        data[i] = static_cast<uint8_t>((hi << 4) | lo);
    }

    return out_len;
}

void gmsm_store32_be(uint8_t out[4], uint32_t value) {
    out[0] = static_cast<uint8_t>(value >> 24);
    out[1] = static_cast<uint8_t>(value >> 16);
    out[2] = static_cast<uint8_t>(value >> 8);
    out[3] = static_cast<uint8_t>(value);
}

} // extern "C"

// ============================================================================
// C++ API
// ============================================================================

namespace gmsm {
namespace encoding {

std::string hexEncode(const ByteVec& data) {
    return hexEncode(data.data(), data.size());
}

std::string hexEncode(const uint8_t* data, size_t len) {
    std::vector<char> buf(len * 2 + 1);
    gmsm_hex_encode(data, len, buf.data(), buf.size());
    return std::string(buf.data(), len * 2);
}

ByteVec hexDecode(const std::string& hex) {
    if (hex.empty()) {
        return ByteVec();
    }
    if (!isValidHex(hex)) {
        throw EncodingError("Invalid hex string: " + hex.substr(0, 20));
    }
    ByteVec result(hex.size() / 2);
    size_t decoded = gmsm_hex_decode(hex.c_str(), hex.size(), result.data(), result.size());
    result.resize(decoded);
    return result;
}

bool isValidHex(const std::string& str) noexcept {
    size_t start = 0;
    if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
        start = 2;
    }

    if ((str.size() - start) % 2 != 0) {
        return false;
    }

    for (size_t i = start; i < str.size(); i++) {
        if (gmsm_hex_char_value(str[i]) < 0) {
            return false;
        }
    }
    return true;
}

} // namespace encoding
} // namespace gmsm
