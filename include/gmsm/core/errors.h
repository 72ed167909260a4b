/**
 * @file errors.h
 * @brief Exception hierarchy for the gmsm C++ API
 *
 * Data-validation failures derive from CryptoError (std::runtime_error).
 * Programming errors such as using an object before init() derive from
 * StateError (std::logic_error). Each type carries the gmsm_error_t code
 * the C ABI reports for it.
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#ifndef GMSM_CORE_ERRORS_H
#define GMSM_CORE_ERRORS_H

#include "gmsm/core/common.h"

#include <stdexcept>
#include <string>

namespace gmsm {

/**
 * @brief Base class of all data-validation failures
 */
class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& what,
                         gmsm_error_t code = GMSM_ERROR_INTERNAL)
        : std::runtime_error(what), code_(code) {}

    gmsm_error_t code() const noexcept { return code_; }

private:
    gmsm_error_t code_;
};

/** Inversion of zero, singular curve parameters */
class MathDomainError : public CryptoError {
public:
    explicit MathDomainError(const std::string& what)
        : CryptoError(what, GMSM_ERROR_MATH_DOMAIN) {}
};

/** Point not on the curve, malformed encoding, or failed subgroup check */
class InvalidPointError : public CryptoError {
public:
    explicit InvalidPointError(const std::string& what)
        : CryptoError(what, GMSM_ERROR_INVALID_POINT) {}
};

/** Private scalar out of [1, n-1], invalid public point, domain mismatch */
class InvalidKeyError : public CryptoError {
public:
    explicit InvalidKeyError(const std::string& what)
        : CryptoError(what, GMSM_ERROR_INVALID_KEY) {}
};

/** Malformed signature encoding */
class SignatureFormatError : public CryptoError {
public:
    explicit SignatureFormatError(const std::string& what)
        : CryptoError(what, GMSM_ERROR_VERIFICATION_FAILED) {}
};

/** Signature component outside [1, n-1] */
class SignatureRangeError : public CryptoError {
public:
    explicit SignatureRangeError(const std::string& what)
        : CryptoError(what, GMSM_ERROR_VERIFICATION_FAILED) {}
};

/** MAC or confirmation tag mismatch. No partial output is ever returned. */
class AuthenticationFailure : public CryptoError {
public:
    explicit AuthenticationFailure(const std::string& what)
        : CryptoError(what, GMSM_ERROR_AUTH_FAILED) {}
};

/** Empty plaintext or truncated ciphertext */
class InputTooShortError : public CryptoError {
public:
    explicit InputTooShortError(const std::string& what)
        : CryptoError(what, GMSM_ERROR_INPUT_TOO_SHORT) {}
};

/**
 * @brief Misuse of a stateful object (not initialized, wrong key kind)
 */
class StateError : public std::logic_error {
public:
    explicit StateError(const std::string& what) : std::logic_error(what) {}
};

} // namespace gmsm

#endif // GMSM_CORE_ERRORS_H
