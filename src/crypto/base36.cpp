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
 * @file base36.cpp
 * @brief Schoolbook long division implementation of the base-36 codec.
 */

#include "kestrel/crypto/base36.hpp"

#include <algorithm>
#include <cmath>

namespace kestrel::crypto {

size_t Base36::width_for(size_t byte_count)
{
    if (byte_count == 0) {
        return 0;
    }
    // 36^w is never a power of two, so the ceiling is never exact.
    const double digits = static_cast<double>(byte_count) * 8.0 / std::log2(36.0);
    return static_cast<size_t>(std::ceil(digits));
}

/**
 * @brief Converts a big-endian byte string to base 36.
 *
 * Implementation Strategy:
 * 1. **Working Copy**: The dividend is copied so the caller's buffer is untouched.
 * 2. **Long Division**: Each pass divides the whole number by 36 in place,
 * carrying the remainder byte-by-byte from the most significant end. The final
 * remainder is the next least significant digit.
 * 3. **Padding**: Exactly `width_for(n)` passes are made, which emits leading
 * zeros once the dividend is exhausted.
 */
std::string Base36::encode(const std::vector<uint8_t>& bytes)
{
    const size_t width = width_for(bytes.size());
    std::vector<uint8_t> dividend(bytes);
    std::string out(width, '0');

    for (size_t pos = width; pos > 0; --pos) {
        uint32_t remainder = 0;
        for (uint8_t& byte : dividend) {
            const uint32_t acc = (remainder << 8) | byte;
            byte = static_cast<uint8_t>(acc / 36);
            remainder = acc % 36;
        }
        out[pos - 1] = kAlphabet[remainder];
    }

    return out;
}

std::string Base36::encode(uint64_t value)
{
    if (value == 0) {
        return "0";
    }
    std::string out;
    while (value > 0) {
        out.push_back(kAlphabet[value % 36]);
        value /= 36;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

bool Base36::is_digits(std::string_view text)
{
    return std::all_of(text.begin(), text.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z');
    });
}

} // namespace kestrel::crypto
