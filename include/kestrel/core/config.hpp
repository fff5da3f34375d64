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
 * @file config.hpp
 * @brief Validated construction parameters of a token generator.
 *
 * @details
 * `GeneratorConfig` can only hold valid values: it is either default-built
 * (length 24, SHA3-256, process fingerprint) or produced by `make()`, which
 * performs every check eagerly. A generator therefore never re-validates.
 */

#pragma once

#include "kestrel/crypto/digest.hpp"

#include <optional>
#include <string>

namespace kestrel::core {

/**
 * @class GeneratorConfig
 * @brief Immutable, pre-validated generator settings.
 */
class GeneratorConfig {
  public:
    static constexpr int kMinLength = 24;
    static constexpr int kMaxLength = 32;
    static constexpr int kDefaultLength = 24;
    static constexpr crypto::HashAlgorithm kDefaultAlgorithm = crypto::HashAlgorithm::SHA3_256;

    /// @brief Defaults: length 24, SHA3-256, fingerprint derived from the process.
    GeneratorConfig() = default;

    /**
     * @brief Validates and builds a configuration. Absent arguments take defaults.
     *
     * Checks run in order: length, fingerprint, algorithm.
     *
     * @param length Token length, must lie in `[24, 32]`.
     * @param fingerprint Explicit fingerprint, must be non-empty when given.
     * @param algorithm Algorithm identifier (see `crypto::parse_algorithm`).
     *
     * @throws kestrel::InvalidLength
     * @throws kestrel::InvalidFingerprint
     * @throws kestrel::UnsupportedAlgorithm
     *
     * @code
     * auto cfg = GeneratorConfig::make(28, std::nullopt, std::string("SHA256"));
     * @endcode
     */
    static GeneratorConfig make(std::optional<long long> length,
                                std::optional<std::string> fingerprint = std::nullopt,
                                std::optional<std::string> algorithm = std::nullopt);

    int length() const { return length_; }

    /// @brief Explicit fingerprint, or `std::nullopt` to derive one from the process.
    const std::optional<std::string>& fingerprint() const { return fingerprint_; }

    crypto::HashAlgorithm algorithm() const { return algorithm_; }

    /// @brief Copy of this configuration with a different algorithm.
    GeneratorConfig with_algorithm(crypto::HashAlgorithm algorithm) const;

  private:
    int length_ = kDefaultLength;
    std::optional<std::string> fingerprint_;
    crypto::HashAlgorithm algorithm_ = kDefaultAlgorithm;
};

} // namespace kestrel::core
