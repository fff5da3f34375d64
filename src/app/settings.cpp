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
 * @file settings.cpp
 * @brief cJSON-backed settings loader and command-line parser.
 */

#include "kestrel/app/settings.hpp"

#include "kestrel/infra/string.hpp"

#include <cJSON.h>
#include <cmath>
#include <fstream>
#include <limits>
#include <memory>
#include <sstream>

namespace kestrel::app {

namespace {

/// @brief RAII owner for a parsed cJSON tree.
struct JsonDeleter {
    void operator()(cJSON* node) const { cJSON_Delete(node); }
};

using JsonPtr = std::unique_ptr<cJSON, JsonDeleter>;

/// @brief Returns the integral value of a JSON number, or nullopt for fractions/non-numbers.
std::optional<long long> integral_value(const cJSON* node)
{
    if (!cJSON_IsNumber(node)) {
        return std::nullopt;
    }
    const double value = node->valuedouble;
    if (!std::isfinite(value) || std::floor(value) != value ||
        value < static_cast<double>(std::numeric_limits<long long>::min()) ||
        value > static_cast<double>(std::numeric_limits<long long>::max())) {
        return std::nullopt;
    }
    return static_cast<long long>(value);
}

size_t positive_count(std::optional<long long> value, const std::string& name)
{
    if (!value || *value < 1) {
        throw SettingsError("'" + name + "' must be a positive integer");
    }
    return static_cast<size_t>(*value);
}

long long parse_length(const std::string& text)
{
    auto value = infra::String::parse_int(infra::String::trim(text));
    if (!value) {
        throw InvalidLength("Token length '" + text + "' is not an integer");
    }
    return *value;
}

OutputFormat parse_format(const std::string& text)
{
    const std::string key = infra::String::to_lower(infra::String::trim(text));
    if (key == "text") {
        return OutputFormat::TEXT;
    }
    if (key == "json") {
        return OutputFormat::JSON;
    }
    throw SettingsError("Unknown output format '" + text + "' (expected text or json)");
}

infra::LogLevel parse_log_level(const std::string& text)
{
    auto level = infra::Logger::parse_level(text);
    if (!level) {
        throw SettingsError("Unknown log level '" + text + "'");
    }
    return *level;
}

/// @brief Flags whose next argument is their value rather than another flag.
bool takes_value(const std::string& arg)
{
    return arg == "--config" || arg == "--count" || arg == "-n" || arg == "--length" ||
           arg == "-l" || arg == "--fingerprint" || arg == "--algorithm" || arg == "-a" ||
           arg == "--threads" || arg == "-t" || arg == "--log-level" || arg == "--validate";
}

} // namespace

/**
 * @brief Overlays JSON keys on the current settings.
 *
 * Absent keys leave the current value untouched. Unknown keys are ignored so
 * one file can be shared with other tools.
 */
void Settings::merge_json(const std::string& json_text)
{
    JsonPtr root(cJSON_Parse(json_text.c_str()));
    if (!root || !cJSON_IsObject(root.get())) {
        throw SettingsError("Configuration is not a valid JSON object");
    }

    if (const cJSON* node = cJSON_GetObjectItem(root.get(), "length")) {
        auto value = integral_value(node);
        if (!value) {
            throw InvalidLength("Configuration key 'length' must be an integer");
        }
        length = *value;
    }

    if (const cJSON* node = cJSON_GetObjectItem(root.get(), "fingerprint")) {
        if (!cJSON_IsString(node) || node->valuestring == nullptr) {
            throw InvalidFingerprint("Configuration key 'fingerprint' must be a string");
        }
        fingerprint = std::string(node->valuestring);
    }

    if (const cJSON* node = cJSON_GetObjectItem(root.get(), "algorithm")) {
        if (!cJSON_IsString(node) || node->valuestring == nullptr) {
            throw UnsupportedAlgorithm("Configuration key 'algorithm' must be a string");
        }
        algorithm = std::string(node->valuestring);
    }

    if (const cJSON* node = cJSON_GetObjectItem(root.get(), "count")) {
        count = positive_count(integral_value(node), "count");
    }

    if (const cJSON* node = cJSON_GetObjectItem(root.get(), "threads")) {
        threads = positive_count(integral_value(node), "threads");
    }

    if (const cJSON* node = cJSON_GetObjectItem(root.get(), "format")) {
        if (!cJSON_IsString(node) || node->valuestring == nullptr) {
            throw SettingsError("Configuration key 'format' must be a string");
        }
        format = parse_format(node->valuestring);
    }

    if (const cJSON* node = cJSON_GetObjectItem(root.get(), "log_level")) {
        if (!cJSON_IsString(node) || node->valuestring == nullptr) {
            throw SettingsError("Configuration key 'log_level' must be a string");
        }
        log_level = parse_log_level(node->valuestring);
    }

    if (const cJSON* node = cJSON_GetObjectItem(root.get(), "fallback")) {
        if (!cJSON_IsBool(node)) {
            throw SettingsError("Configuration key 'fallback' must be a boolean");
        }
        fallback = cJSON_IsTrue(node);
    }
}

void Settings::merge_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in) {
        throw SettingsError("Cannot open configuration file '" + path + "'");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    merge_json(buffer.str());
}

core::GeneratorConfig Settings::generator_config() const
{
    return core::GeneratorConfig::make(length, fingerprint, algorithm);
}

/**
 * @brief Two-pass argument parsing.
 *
 * Pass 1 locates `--config` so the file forms the base layer, stepping over
 * the values of other options. Pass 2 applies every other flag on top, in
 * order.
 */
Settings Settings::from_arguments(const std::vector<std::string>& args)
{
    Settings settings;

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                throw SettingsError("Option '--config' requires a value");
            }
            settings.merge_file(args[i + 1]);
        }
        if (takes_value(args[i])) {
            ++i;
        }
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw SettingsError("Option '" + arg + "' requires a value");
            }
            return args[++i];
        };

        if (arg == "--help" || arg == "-h") {
            settings.help = true;
        } else if (arg == "--config") {
            value();
        } else if (arg == "--count" || arg == "-n") {
            settings.count =
                positive_count(infra::String::parse_int(value()), "count");
        } else if (arg == "--length" || arg == "-l") {
            settings.length = parse_length(value());
        } else if (arg == "--fingerprint") {
            settings.fingerprint = value();
        } else if (arg == "--algorithm" || arg == "-a") {
            settings.algorithm = value();
        } else if (arg == "--threads" || arg == "-t") {
            settings.threads =
                positive_count(infra::String::parse_int(value()), "threads");
        } else if (arg == "--json") {
            settings.format = OutputFormat::JSON;
        } else if (arg == "--no-fallback") {
            settings.fallback = false;
        } else if (arg == "--log-level") {
            settings.log_level = parse_log_level(value());
        } else if (arg == "--verbose" || arg == "-v") {
            settings.log_level = infra::LogLevel::DEBUG;
        } else if (arg == "--validate") {
            settings.validate = value();
        } else {
            throw SettingsError("Unknown option '" + arg + "'");
        }
    }

    return settings;
}

std::string usage(const std::string& binary_name)
{
    std::ostringstream out;
    out << "Usage: " << binary_name << " [OPTIONS]\n"
        << "Options:\n"
        << "  --config PATH        JSON settings file (flags override it)\n"
        << "  -n, --count N        Number of tokens to generate (Default: 1)\n"
        << "  -l, --length N       Token length, 24..32 (Default: 24)\n"
        << "  --fingerprint S      Host fingerprint (Default: derived from host and pid)\n"
        << "  -a, --algorithm S    sha3-256 or sha256 (Default: sha3-256)\n"
        << "  -t, --threads N      Worker threads sharing one generator (Default: 1)\n"
        << "  --json               Emit a JSON document instead of one token per line\n"
        << "  --no-fallback        Fail instead of switching to the alternate algorithm\n"
        << "  --log-level L        trace|debug|info|warn|error|fatal (Default: info)\n"
        << "  -v, --verbose        Same as --log-level debug\n"
        << "  --validate TOKEN     Check a token's format; exit 0 if valid, 1 if not\n"
        << "  -h, --help           Show this help message\n";
    return out.str();
}

} // namespace kestrel::app
