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
 * @file generator.cpp
 * @brief Token assembly: prefix letter + hash block, truncated.
 */

#include "kestrel/core/generator.hpp"

#include "kestrel/core/fingerprint.hpp"
#include "kestrel/crypto/base36.hpp"
#include "kestrel/crypto/entropy.hpp"
#include "kestrel/errors.hpp"
#include "kestrel/infra/logger.hpp"

#include <chrono>
#include <cstdint>
#include <vector>

namespace kestrel::core {

namespace {

void append(std::vector<uint8_t>& buffer, const std::string& text)
{
    buffer.insert(buffer.end(), text.begin(), text.end());
}

std::string wall_clock_nanos()
{
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::to_string(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

} // namespace

TokenGenerator::TokenGenerator(const GeneratorConfig& config, ossl_lib_ctx_st* library)
    : length_(config.length()), digest_(config.algorithm(), library),
      fingerprint_(config.fingerprint() ? *config.fingerprint()
                                        : Fingerprint::for_process(digest_))
{
    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Generator: initialized (length=" + std::to_string(length_) +
                           ", algorithm=" + std::string(crypto::to_string(algorithm())) +
                           ", fingerprint=" + fingerprint_.substr(0, 8) + "...)");
}

TokenGenerator::TokenGenerator(long long length,
                               std::optional<std::string> fingerprint,
                               std::optional<std::string> algorithm)
    : TokenGenerator(GeneratorConfig::make(length, std::move(fingerprint), std::move(algorithm)))
{
}

std::unique_ptr<TokenGenerator> TokenGenerator::with_fallback(const GeneratorConfig& config,
                                                              ossl_lib_ctx_st* library)
{
    try {
        return std::make_unique<TokenGenerator>(config, library);
    } catch (const AlgorithmUnavailable& e) {
        const crypto::HashAlgorithm fallback = crypto::alternate(config.algorithm());
        infra::Logger::log(infra::LogLevel::WARN,
                           std::string("Generator: ") + e.what() + "; falling back to " +
                               std::string(crypto::to_string(fallback)));
        return std::make_unique<TokenGenerator>(config.with_algorithm(fallback), library);
    }
}

/**
 * @brief Hashes one fresh input block.
 *
 * Input layout (UTF-8 / raw bytes, concatenated in this order):
 * 1. `kEntropyBytes` secure random bytes.
 * 2. Wall-clock nanoseconds since the epoch, decimal text.
 * 3. The counter's next value, decimal text.
 * 4. The fingerprint.
 *
 * A 32-byte digest encodes to 50 base-36 digits, leaving 48 after the skewed
 * prefix is dropped, which always covers the 31 characters a token needs.
 */
std::string TokenGenerator::hash_block()
{
    std::vector<uint8_t> input = crypto::SecureRandom::bytes(kEntropyBytes);
    append(input, wall_clock_nanos());
    append(input, std::to_string(counter_.next()));
    append(input, fingerprint_);

    const std::string encoded = crypto::Base36::encode(digest_.compute(input.data(), input.size()));
    return encoded.substr(kSkewedPrefix);
}

std::string TokenGenerator::generate()
{
    std::string token(1, crypto::SecureRandom::letter());
    token += hash_block();
    token.resize(static_cast<size_t>(length_));
    return token;
}

bool is_token(std::string_view token, int min_length, int max_length)
{
    const auto size = static_cast<long long>(token.size());
    if (size < min_length || size > max_length || token.empty()) {
        return false;
    }
    if (token.front() < 'a' || token.front() > 'z') {
        return false;
    }
    return crypto::Base36::is_digits(token.substr(1));
}

} // namespace kestrel::core
