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
 * @file settings.hpp
 * @brief Command-line and JSON-file settings of the `kestrel` tool.
 *
 * @details
 * Settings are gathered from an optional JSON file (`--config PATH`) and then
 * overridden by command-line flags. Generator parameters are only collected
 * here; their validation belongs to `core::GeneratorConfig::make`, except that
 * a non-integer length is rejected with `InvalidLength` while parsing.
 *
 * **Recognized JSON keys:**
 * `length`, `fingerprint`, `algorithm`, `count`, `threads`, `format`,
 * `log_level`, `fallback`.
 */

#pragma once

#include "kestrel/core/config.hpp"
#include "kestrel/errors.hpp"
#include "kestrel/infra/logger.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace kestrel::app {

/// @brief Malformed tool settings (unknown flag, bad count, unreadable file...).
class SettingsError : public ConfigError {
  public:
    explicit SettingsError(const std::string& message) : ConfigError(message) {}
};

/**
 * @enum OutputFormat
 * @brief How generated tokens are written to stdout.
 */
enum class OutputFormat {
    TEXT, ///< One token per line.
    JSON  ///< A single JSON object with metadata and a `tokens` array.
};

/**
 * @struct Settings
 * @brief Fully merged tool settings.
 */
struct Settings {
    std::optional<long long> length;
    std::optional<std::string> fingerprint;
    std::optional<std::string> algorithm;

    size_t count = 1;
    size_t threads = 1;
    OutputFormat format = OutputFormat::TEXT;
    infra::LogLevel log_level = infra::LogLevel::INFO;
    bool fallback = true;

    /// @brief Token to check instead of generating (`--validate`).
    std::optional<std::string> validate;
    bool help = false;

    /**
     * @brief Applies the keys of a JSON document on top of the current values.
     *
     * @throws SettingsError On malformed JSON or a wrongly typed key.
     * @throws kestrel::InvalidLength If `length` is not an integral number.
     */
    void merge_json(const std::string& json_text);

    /**
     * @brief Reads `path` and applies it with `merge_json`.
     *
     * @throws SettingsError If the file cannot be read.
     */
    void merge_file(const std::string& path);

    /**
     * @brief Validates the generator parameters.
     *
     * @throws kestrel::InvalidLength
     * @throws kestrel::InvalidFingerprint
     * @throws kestrel::UnsupportedAlgorithm
     */
    core::GeneratorConfig generator_config() const;

    /**
     * @brief Parses `argv`, loading `--config` (if present) before applying flags.
     *
     * @code
     * // kestrel --config kestrel.json --count 10 --json
     * Settings settings = Settings::from_arguments({"--config", "kestrel.json", "--count", "10", "--json"});
     * @endcode
     */
    static Settings from_arguments(const std::vector<std::string>& args);
};

/// @brief Usage text for `--help`.
std::string usage(const std::string& binary_name);

} // namespace kestrel::app
