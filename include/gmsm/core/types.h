/**
 * @file types.h
 * @brief Type definitions for gmsm
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#ifndef GMSM_CORE_TYPES_H
#define GMSM_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <vector>
#include <array>

namespace gmsm {

// Byte vector
using ByteVec = std::vector<uint8_t>;

// Byte array templates
template<size_t N>
using ByteArray = std::array<uint8_t, N>;

// Hash digests
using SM3Hash = ByteArray<32>;

} // namespace gmsm

#endif // GMSM_CORE_TYPES_H
