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
 * @file entropy.cpp
 * @brief Implementation of the secure random source.
 */

#include "kestrel/crypto/entropy.hpp"

#include "kestrel/errors.hpp"

#include <limits>
#include <stdexcept>
#include <string>

#include <openssl/err.h>
#include <openssl/rand.h>

namespace kestrel::crypto {

namespace {

/// @brief Upper bound of a single `RAND_bytes` request (its length parameter is an `int`).
constexpr size_t kMaxChunk = static_cast<size_t>(std::numeric_limits<int>::max());

std::string openssl_error()
{
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "no error queued";
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return std::string(buffer);
}

uint64_t next_u64()
{
    uint64_t value = 0;
    SecureRandom::fill(reinterpret_cast<uint8_t*>(&value), sizeof(value));
    return value;
}

} // namespace

void SecureRandom::fill(uint8_t* buffer, size_t count)
{
    while (count > 0) {
        size_t chunk = count < kMaxChunk ? count : kMaxChunk;
        if (RAND_bytes(buffer, static_cast<int>(chunk)) != 1) {
            throw EntropyError("Entropy: RAND_bytes failed (" + openssl_error() + ")");
        }
        buffer += chunk;
        count -= chunk;
    }
}

std::vector<uint8_t> SecureRandom::bytes(size_t count)
{
    std::vector<uint8_t> out(count);
    if (count > 0) {
        fill(out.data(), count);
    }
    return out;
}

/**
 * @brief Unbiased bounded draw.
 *
 * Implementation Strategy:
 * 1. **Span**: Computes `max - min`. A full 64-bit span needs no reduction.
 * 2. **Rejection Zone**: Discards draws at or above the largest multiple of
 * `span + 1`, so the final modulo maps every residue equally often.
 */
uint64_t SecureRandom::range(uint64_t min, uint64_t max)
{
    if (min > max) {
        throw std::invalid_argument("Entropy: range() requires min <= max");
    }

    const uint64_t span = max - min;
    if (span == std::numeric_limits<uint64_t>::max()) {
        return next_u64();
    }

    const uint64_t buckets = span + 1;
    const uint64_t limit = std::numeric_limits<uint64_t>::max() -
                           (std::numeric_limits<uint64_t>::max() % buckets);

    uint64_t draw = next_u64();
    while (draw >= limit) {
        draw = next_u64();
    }
    return min + (draw % buckets);
}

char SecureRandom::letter()
{
    return static_cast<char>('a' + range(0, 25));
}

} // namespace kestrel::crypto
