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
 * @file fingerprint.cpp
 * @brief POSIX implementation of the process fingerprint.
 */

#include "kestrel/core/fingerprint.hpp"

#include "kestrel/crypto/base36.hpp"
#include "kestrel/errors.hpp"

#include <unistd.h>

namespace kestrel::core {

std::string Fingerprint::process_identity()
{
    char host[256] = {0};
    if (gethostname(host, sizeof(host) - 1) != 0 || host[0] == '\0') {
        return "";
    }
    return std::string(host) + ":" + std::to_string(static_cast<long long>(getpid()));
}

std::string Fingerprint::derive(const std::string& identity, const crypto::Digest& digest)
{
    if (identity.empty()) {
        throw InvalidFingerprint(
            "Process identity is unavailable; supply an explicit fingerprint");
    }
    return crypto::Base36::encode(digest.compute(identity));
}

std::string Fingerprint::for_process(const crypto::Digest& digest)
{
    return derive(process_identity(), digest);
}

} // namespace kestrel::core
