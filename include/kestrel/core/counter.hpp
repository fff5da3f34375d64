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
 * @file counter.hpp
 * @brief Lock-free monotonic counter owned by a single generator.
 */

#pragma once

#include <atomic>
#include <cstdint>

namespace kestrel::core {

/**
 * @class Counter
 * @brief An atomically incrementing 64-bit sequence.
 *
 * @details
 * Every `next()` call observes a distinct value, even under unbounded
 * concurrency. Overflow wraps modulo 2^64 and is not an error. The counter is
 * not persisted: a restarted process starts from a fresh random seed.
 */
class Counter {
  public:
    /// @brief Upper bound (inclusive) of the random seed drawn by the default constructor.
    static constexpr uint64_t kMaxSeed = 2057;

    /**
     * @brief Seeds the counter with a secure random value in `[0, kMaxSeed]`.
     *
     * @throws kestrel::EntropyError If the secure random source fails.
     */
    Counter();

    /// @brief Seeds the counter with an explicit starting value.
    explicit Counter(uint64_t seed) : value_(seed) {}

    Counter(const Counter&) = delete;
    Counter& operator=(const Counter&) = delete;

    /**
     * @brief Atomically returns the current value and advances it by one.
     *
     * Relaxed ordering suffices: only the uniqueness of each returned value
     * matters, not its ordering relative to other memory operations.
     */
    uint64_t next() { return value_.fetch_add(1, std::memory_order_relaxed); }

    /// @brief Value the next call to `next()` would return. Diagnostic only.
    uint64_t peek() const { return value_.load(std::memory_order_relaxed); }

  private:
    std::atomic<uint64_t> value_;
};

} // namespace kestrel::core
