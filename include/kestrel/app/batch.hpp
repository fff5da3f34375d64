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
 * @file batch.hpp
 * @brief Bulk token generation and output rendering for the CLI.
 */

#pragma once

#include "kestrel/core/generator.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace kestrel::app {

/**
 * @brief Generates `count` tokens on `threads` workers sharing `generator`.
 *
 * The batch is split into one contiguous slice per worker; each slice is
 * written in place, so the result order matches submission order.
 *
 * @throws kestrel::EntropyError / kestrel::DigestError Rethrown from a worker.
 */
std::vector<std::string> generate_batch(core::TokenGenerator& generator, size_t count,
                                        size_t threads);

/// @brief One token per line, each terminated by `'\n'`.
std::string render_text(const std::vector<std::string>& tokens);

/**
 * @brief `{"algorithm": "...", "length": N, "tokens": [...]}`, formatted by cJSON.
 */
std::string render_json(const core::TokenGenerator& generator,
                        const std::vector<std::string>& tokens);

} // namespace kestrel::app
