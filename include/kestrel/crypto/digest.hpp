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
 * @file digest.hpp
 * @brief Selectable secure hash functions over the OpenSSL EVP interface.
 *
 * @details
 * Kestrel supports exactly two algorithms: SHA3-256 (the default) and SHA-256.
 * Algorithm names are parsed case-insensitively and normalized to lowercase.
 * A `Digest` owns one message digest fetched from the loaded OpenSSL 3
 * providers and is immutable, so a single instance may be shared freely
 * between threads.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations keep <openssl/evp.h> out of the public headers.
struct evp_md_st;
struct ossl_lib_ctx_st;

namespace kestrel::crypto {

/**
 * @enum HashAlgorithm
 * @brief The supported hash functions.
 */
enum class HashAlgorithm {
    SHA3_256, ///< Keccak-based SHA3-256 (FIPS 202). Default.
    SHA256    ///< SHA-2 family SHA-256 (FIPS 180-4).
};

/**
 * @brief Parses an algorithm identifier.
 *
 * Accepted spellings (case-insensitive, surrounding whitespace ignored):
 * - `sha3-256`, `sha3_256` -> `HashAlgorithm::SHA3_256`
 * - `sha-256`, `sha256`    -> `HashAlgorithm::SHA256`
 *
 * @throws kestrel::UnsupportedAlgorithm For any other identifier.
 */
HashAlgorithm parse_algorithm(std::string_view name);

/// @brief Canonical lowercase name (`"sha3-256"` or `"sha256"`).
std::string_view to_string(HashAlgorithm algorithm);

/// @brief The other supported algorithm. Used for availability fallback.
HashAlgorithm alternate(HashAlgorithm algorithm);

/**
 * @class Digest
 * @brief A resolved hash function ready to compute digests.
 */
class Digest {
  public:
    /**
     * @brief Fetches `algorithm` from the providers loaded in `library`.
     *
     * @param algorithm The hash function to resolve.
     * @param library OpenSSL library context, or `nullptr` for the default
     * one. It must outlive this `Digest`.
     *
     * @throws kestrel::AlgorithmUnavailable If no loaded provider implements
     * the algorithm (e.g. a FIPS-only or base-only configuration).
     */
    explicit Digest(HashAlgorithm algorithm, ossl_lib_ctx_st* library = nullptr);

    /**
     * @brief Hashes `size` bytes starting at `data`.
     *
     * @return The raw digest bytes (`size()` bytes long).
     * @throws kestrel::DigestError If OpenSSL reports a failure mid-computation.
     */
    std::vector<uint8_t> compute(const uint8_t* data, size_t size) const;

    /// @brief Convenience overload hashing the UTF-8 bytes of a string.
    std::vector<uint8_t> compute(std::string_view text) const;

    /// @brief Output size in bytes (32 for both supported algorithms).
    size_t size() const { return size_; }

    HashAlgorithm algorithm() const { return algorithm_; }

  private:
    struct MdDeleter {
        void operator()(evp_md_st* md) const;
    };

    HashAlgorithm algorithm_;
    std::unique_ptr<evp_md_st, MdDeleter> md_;
    size_t size_;
};

} // namespace kestrel::crypto
