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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * This header defines the `String` utility class, a static extension to
 * `std::string` used to sanitize configuration values: algorithm names,
 * command-line arguments and JSON settings.
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace kestrel::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string The trimmed content. Empty if `s` is empty or
     * consists solely of whitespace.
     *
     * @code
     * std::string clean = kestrel::infra::String::trim("  SHA256 \n"); // "SHA256"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /**
     * @brief ASCII lowercase conversion. Non-ASCII bytes are left untouched.
     */
    static std::string to_lower(std::string s);

    /**
     * @brief Strict base-10 integer parse.
     *
     * The whole input must be an optional sign followed by digits. Anything
     * else (empty input, `"24.5"`, `"2x"`, overflow) yields `std::nullopt`.
     */
    static std::optional<long long> parse_int(std::string_view s);
};

} // namespace kestrel::infra
