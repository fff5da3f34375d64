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
 * @file base36.hpp
 * @brief Base-36 text encoding of arbitrary-precision unsigned integers.
 *
 * @details
 * Byte sequences are read as big-endian unsigned integers and rendered with
 * the alphabet `0-9a-z` (lowercase). Encoding is fixed-width: the output is
 * left-padded with `'0'` to the number of digits needed for the largest value
 * of the input's byte width, so a 32-byte digest always yields 50 characters.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace kestrel::crypto {

/**
 * @class Base36
 * @brief Stateless base-36 codec.
 */
class Base36 {
  public:
    /// @brief The digit alphabet, in ascending value order.
    static constexpr std::string_view kAlphabet = "0123456789abcdefghijklmnopqrstuvwxyz";

    /**
     * @brief Encodes a big-endian unsigned integer.
     *
     * @param bytes The integer's bytes, most significant first.
     * @return A string of exactly `width_for(bytes.size())` characters.
     *
     * @code
     * Base36::encode({0x01, 0x00}); // "0074" (256 = 7*36 + 4, padded to 4 digits)
     * @endcode
     */
    static std::string encode(const std::vector<uint8_t>& bytes);

    /// @brief Encodes a 64-bit value without padding (`0` encodes as `"0"`).
    static std::string encode(uint64_t value);

    /**
     * @brief Number of base-36 digits required to represent any `byte_count`-byte value.
     *
     * Smallest `w` such that `36^w >= 256^byte_count`.
     */
    static size_t width_for(size_t byte_count);

    /// @brief True if every character of `text` belongs to the alphabet.
    static bool is_digits(std::string_view text);
};

} // namespace kestrel::crypto
