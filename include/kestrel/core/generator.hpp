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
 * @file generator.hpp
 * @brief Collision-resistant token generation.
 *
 * @details
 * A token is one random lowercase letter followed by the base-36 rendering of
 * a secure hash over fresh random bytes, the wall-clock time, a per-generator
 * counter and a host fingerprint, truncated to the configured length:
 *
 * `[a-z][0-9a-z]{length - 1}`
 *
 * Tokens are not ordered and are not UUID-compatible. One `TokenGenerator` is
 * meant to be built once and shared by every thread of the process.
 */

#pragma once

#include "kestrel/core/config.hpp"
#include "kestrel/core/counter.hpp"
#include "kestrel/crypto/digest.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace kestrel::core {

/**
 * @class TokenGenerator
 * @brief Thread-safe token factory.
 *
 * @details
 * All configuration is validated in the constructor. Afterwards `generate()`
 * has no error path of its own; it can only propagate an unrecoverable
 * `EntropyError` or `DigestError` from the crypto library.
 *
 * **Concurrency:** the counter is the only mutable state and is advanced with
 * a single atomic `fetch_add`; random generation and hashing run without any
 * lock.
 */
class TokenGenerator {
  public:
    /// @brief Random bytes hashed per token. Dominates the hash input.
    static constexpr size_t kEntropyBytes = 2 * GeneratorConfig::kMaxLength;

    /// @brief Leading base-36 digits of the digest that are discarded (skewed distribution).
    static constexpr size_t kSkewedPrefix = 2;

    /**
     * @brief Builds a generator from a validated configuration.
     *
     * @param library OpenSSL library context the digest is fetched from, or
     * `nullptr` for the default one. It must outlive the generator.
     *
     * @throws kestrel::AlgorithmUnavailable If OpenSSL lacks the configured algorithm.
     * @throws kestrel::InvalidFingerprint If no fingerprint was given and the
     * process identity cannot be determined.
     */
    explicit TokenGenerator(const GeneratorConfig& config = GeneratorConfig(),
                            ossl_lib_ctx_st* library = nullptr);

    /**
     * @brief Validates the arguments and builds a generator.
     *
     * @code
     * kestrel::core::TokenGenerator generator(24);
     * std::string token = generator.generate(); // e.g. "k3v0t9c4yq1m8xw2b7n5r6d0"
     * @endcode
     *
     * @throws kestrel::InvalidLength
     * @throws kestrel::InvalidFingerprint
     * @throws kestrel::UnsupportedAlgorithm
     * @throws kestrel::AlgorithmUnavailable
     */
    explicit TokenGenerator(long long length,
                            std::optional<std::string> fingerprint = std::nullopt,
                            std::optional<std::string> algorithm = std::nullopt);

    TokenGenerator(const TokenGenerator&) = delete;
    TokenGenerator& operator=(const TokenGenerator&) = delete;

    /**
     * @brief Builds a generator, retrying once with the alternate algorithm if
     * the configured one is unavailable.
     *
     * Only `AlgorithmUnavailable` triggers the retry; every other error
     * propagates. A warning is logged when the fallback is taken.
     */
    static std::unique_ptr<TokenGenerator> with_fallback(const GeneratorConfig& config,
                                                         ossl_lib_ctx_st* library = nullptr);

    /**
     * @brief Produces a new token of exactly `length()` characters.
     *
     * Side effects: advances the counter once and draws from the secure RNG.
     */
    std::string generate();

    int length() const { return length_; }
    crypto::HashAlgorithm algorithm() const { return digest_.algorithm(); }
    const std::string& fingerprint() const { return fingerprint_; }

  private:
    /// @brief Base-36 digest of one fresh hash input, skewed prefix removed.
    std::string hash_block();

    int length_;
    crypto::Digest digest_;
    std::string fingerprint_;
    Counter counter_;
};

/**
 * @brief Checks the structural shape of a token.
 *
 * @return True when `token` has a length in `[min_length, max_length]`, starts
 * with `[a-z]`, and continues with `[0-9a-z]` only.
 */
bool is_token(std::string_view token,
              int min_length = GeneratorConfig::kMinLength,
              int max_length = GeneratorConfig::kMaxLength);

} // namespace kestrel::core
