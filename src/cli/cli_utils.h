/**
 * @file cli_utils.h
 * @brief Shared helpers for the gmsm command-line tool
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#ifndef GMSM_CLI_UTILS_H
#define GMSM_CLI_UTILS_H

#include "gmsm/core/types.h"
#include "gmsm/crypto/sm/sm2_engine.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>

namespace gmsm {
namespace cli {

/**
 * @brief Read file into byte vector
 */
inline ByteVec read_file(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open input file: " + filename);
    }
    return ByteVec(std::istreambuf_iterator<char>(file),
                   std::istreambuf_iterator<char>());
}

/**
 * @brief Write byte vector to file
 */
inline void write_file(const std::string& filename, const ByteVec& data) {
    std::ofstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open output file: " + filename);
    }
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    if (!file) {
        throw std::runtime_error("Failed to write output file: " + filename);
    }
}

inline ByteVec to_bytes(const std::string& s) {
    return ByteVec(s.begin(), s.end());
}

/**
 * @brief Parse --mode; accepts c1c2c3 and c1c3c2 in any case
 */
inline sm2::SM2Mode parse_mode(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (name == "c1c2c3") {
        return sm2::SM2Mode::C1C2C3;
    }
    if (name == "c1c3c2") {
        return sm2::SM2Mode::C1C3C2;
    }
    throw std::invalid_argument("Unknown ciphertext mode '" + name + "'");
}

inline int fail(const std::string& message) {
    std::cerr << "[ERROR] " << message << "\n";
    return 1;
}

} // namespace cli
} // namespace gmsm

#endif // GMSM_CLI_UTILS_H
