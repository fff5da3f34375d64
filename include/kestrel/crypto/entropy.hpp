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
 * @file entropy.hpp
 * @brief Cryptographically secure randomness backed by the OpenSSL CSPRNG.
 *
 * @details
 * `SecureRandom` is the only entropy source used by Kestrel. It draws from
 * `RAND_bytes`, which is thread-safe and seeded by the operating system. There
 * is no general-purpose PRNG fallback: a failure of the CSPRNG is
 * reported as `kestrel::EntropyError`.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace kestrel::crypto {

/**
 * @class SecureRandom
 * @brief Static accessors over the process-wide secure random generator.
 *
 * @note Calls may block briefly if the kernel entropy pool is not yet
 * initialized (early boot). No timeout is applied.
 */
class SecureRandom {
  public:
    /**
     * @brief Returns `count` secure random bytes.
     *
     * @param count Number of bytes requested. Zero yields an empty vector.
     * @throws kestrel::EntropyError If the CSPRNG cannot supply the bytes.
     */
    static std::vector<uint8_t> bytes(size_t count);

    /**
     * @brief Fills an existing buffer with secure random bytes.
     *
     * @throws kestrel::EntropyError If the CSPRNG cannot supply the bytes.
     */
    static void fill(uint8_t* buffer, size_t count);

    /**
     * @brief Returns a uniformly distributed integer in `[min, max]` (inclusive).
     *
     * Uses rejection sampling over 64-bit draws so that every value in the
     * range is equally likely (no modulo bias).
     *
     * @throws std::invalid_argument If `min > max`.
     * @throws kestrel::EntropyError If the CSPRNG fails.
     *
     * @code
     * uint64_t seed = kestrel::crypto::SecureRandom::range(0, 2057);
     * @endcode
     */
    static uint64_t range(uint64_t min, uint64_t max);

    /**
     * @brief Returns one lowercase ASCII letter drawn uniformly from `a`..`z`.
     */
    static char letter();
};

} // namespace kestrel::crypto
