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
 * @file config.cpp
 * @brief Eager validation of generator settings.
 */

#include "kestrel/core/config.hpp"

#include "kestrel/errors.hpp"

namespace kestrel::core {

GeneratorConfig GeneratorConfig::make(std::optional<long long> length,
                                      std::optional<std::string> fingerprint,
                                      std::optional<std::string> algorithm)
{
    GeneratorConfig config;

    if (length) {
        if (*length < kMinLength || *length > kMaxLength) {
            throw InvalidLength("Token length " + std::to_string(*length) +
                                " is outside [" + std::to_string(kMinLength) + ", " +
                                std::to_string(kMaxLength) + "]");
        }
        config.length_ = static_cast<int>(*length);
    }

    if (fingerprint) {
        if (fingerprint->empty()) {
            throw InvalidFingerprint("Fingerprint must not be empty");
        }
        config.fingerprint_ = std::move(fingerprint);
    }

    if (algorithm) {
        config.algorithm_ = crypto::parse_algorithm(*algorithm);
    }

    return config;
}

GeneratorConfig GeneratorConfig::with_algorithm(crypto::HashAlgorithm algorithm) const
{
    GeneratorConfig copy(*this);
    copy.algorithm_ = algorithm;
    return copy;
}

} // namespace kestrel::core
