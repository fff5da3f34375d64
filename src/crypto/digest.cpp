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
 * @file digest.cpp
 * @brief EVP-backed implementation of the hash engine.
 */

#include "kestrel/crypto/digest.hpp"

#include "kestrel/errors.hpp"
#include "kestrel/infra/string.hpp"

#include <memory>

#include <openssl/err.h>
#include <openssl/evp.h>

namespace kestrel::crypto {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

/// @brief OpenSSL's registered digest name for each algorithm.
const char* evp_name(HashAlgorithm algorithm)
{
    switch (algorithm) {
    case HashAlgorithm::SHA3_256:
        return "SHA3-256";
    case HashAlgorithm::SHA256:
        return "SHA256";
    }
    return "";
}

} // namespace

HashAlgorithm parse_algorithm(std::string_view name)
{
    const std::string normalized = infra::String::to_lower(infra::String::trim(std::string(name)));

    if (normalized == "sha3-256" || normalized == "sha3_256") {
        return HashAlgorithm::SHA3_256;
    }
    if (normalized == "sha-256" || normalized == "sha256") {
        return HashAlgorithm::SHA256;
    }
    throw UnsupportedAlgorithm("Unsupported hash algorithm '" + std::string(name) +
                               "' (expected sha3-256 or sha256)");
}

std::string_view to_string(HashAlgorithm algorithm)
{
    switch (algorithm) {
    case HashAlgorithm::SHA3_256:
        return "sha3-256";
    case HashAlgorithm::SHA256:
        return "sha256";
    }
    return "";
}

HashAlgorithm alternate(HashAlgorithm algorithm)
{
    return algorithm == HashAlgorithm::SHA3_256 ? HashAlgorithm::SHA256
                                                : HashAlgorithm::SHA3_256;
}

void Digest::MdDeleter::operator()(evp_md_st* md) const
{
    EVP_MD_free(md);
}

/**
 * @brief Explicit fetch from the provider set.
 *
 * `EVP_get_digestbyname` returns the built-in method table even when no
 * loaded provider implements it, so availability is decided by
 * `EVP_MD_fetch` instead.
 */
Digest::Digest(HashAlgorithm algorithm, ossl_lib_ctx_st* library)
    : algorithm_(algorithm), md_(EVP_MD_fetch(library, evp_name(algorithm), nullptr)), size_(0)
{
    if (!md_) {
        ERR_clear_error();
        throw AlgorithmUnavailable("Hash algorithm '" + std::string(to_string(algorithm)) +
                                   "' is not provided by the loaded OpenSSL providers");
    }
    size_ = static_cast<size_t>(EVP_MD_get_size(md_.get()));
}

/**
 * @brief One-shot digest computation.
 *
 * A fresh `EVP_MD_CTX` is allocated per call, so concurrent callers never
 * share mutable hashing state.
 */
std::vector<uint8_t> Digest::compute(const uint8_t* data, size_t size) const
{
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw DigestError("Digest: EVP_MD_CTX_new failed");
    }

    std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
    unsigned int written = 0;

    if (EVP_DigestInit_ex(ctx.get(), md_.get(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, size) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out.data(), &written) != 1) {
        throw DigestError("Digest: " + std::string(to_string(algorithm_)) +
                          " computation failed");
    }

    out.resize(written);
    return out;
}

std::vector<uint8_t> Digest::compute(std::string_view text) const
{
    return compute(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

} // namespace kestrel::crypto
