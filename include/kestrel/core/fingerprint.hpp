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
 * @file fingerprint.hpp
 * @brief Derivation of the default host/process fingerprint.
 *
 * @details
 * The fingerprint distinguishes generators running on different hosts or in
 * different processes. By default it is the base-36 digest of the process
 * identity string `"<hostname>:<pid>"`.
 */

#pragma once

#include "kestrel/crypto/digest.hpp"

#include <string>

namespace kestrel::core {

/**
 * @class Fingerprint
 * @brief Static helpers for building process fingerprints.
 */
class Fingerprint {
  public:
    /**
     * @brief Returns the runtime identity string of this process.
     *
     * @return `"<hostname>:<pid>"`, or an empty string when the host name
     * cannot be determined.
     */
    static std::string process_identity();

    /**
     * @brief Hashes `identity` with `digest` and returns it base-36 encoded.
     *
     * @throws kestrel::InvalidFingerprint If `identity` is empty.
     */
    static std::string derive(const std::string& identity, const crypto::Digest& digest);

    /// @brief `derive(process_identity(), digest)`.
    static std::string for_process(const crypto::Digest& digest);
};

} // namespace kestrel::core
