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
 * @file counter.cpp
 * @brief Random seeding of the monotonic counter.
 */

#include "kestrel/core/counter.hpp"

#include "kestrel/crypto/entropy.hpp"

namespace kestrel::core {

Counter::Counter() : value_(crypto::SecureRandom::range(0, kMaxSeed)) {}

} // namespace kestrel::core
