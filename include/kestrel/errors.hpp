/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file errors.hpp
 * @brief Exception hierarchy for the Kestrel token generator.
 *
 * @details
 * Construction-time failures derive from `ConfigError` and are fatal to the
 * construction attempt. Runtime failures of the cryptographic primitives
 * (`EntropyError`, `DigestError`) are unrecoverable and always propagate.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace kestrel {

/**
 * @class Error
 * @brief Root of every exception thrown by Kestrel.
 */
class Error : public std::runtime_error {
  public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class ConfigError
 * @brief Base class for generator configuration rejections.
 */
class ConfigError : public Error {
  public:
    explicit ConfigError(const std::string& message) : Error(message) {}
};

/// @brief Token length is not an integer within [24, 32].
class InvalidLength : public ConfigError {
  public:
    explicit InvalidLength(const std::string& message) : ConfigError(message) {}
};

/// @brief Fingerprint is empty (explicit or derived).
class InvalidFingerprint : public ConfigError {
  public:
    explicit InvalidFingerprint(const std::string& message) : ConfigError(message) {}
};

/// @brief Algorithm identifier is not one of the recognized names.
class UnsupportedAlgorithm : public ConfigError {
  public:
    explicit UnsupportedAlgorithm(const std::string& message) : ConfigError(message) {}
};

/// @brief Algorithm is recognized but the linked crypto library cannot provide it.
class AlgorithmUnavailable : public ConfigError {
  public:
    explicit AlgorithmUnavailable(const std::string& message) : ConfigError(message) {}
};

/**
 * @class EntropyError
 * @brief The secure random source failed to deliver bytes.
 *
 * @note Never caught internally. A weaker generator is never substituted.
 */
class EntropyError : public Error {
  public:
    explicit EntropyError(const std::string& message) : Error(message) {}
};

/// @brief A digest computation failed after the algorithm was resolved.
class DigestError : public Error {
  public:
    explicit DigestError(const std::string& message) : Error(message) {}
};

} // namespace kestrel
