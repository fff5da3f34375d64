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
 * @file main_test.cpp
 * @brief Central orchestrator for the Kestrel Test Suite.
 *
 * @details
 * Aggregates the unit and property tests of every subsystem:
 * Infrastructure, Crypto, Core (configuration, counter, generator) and the
 * command-line App layer.
 */

#include "framework.hpp"

#include "kestrel/infra/logger.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================

// Infrastructure Subsystem (infra_test.cpp)
void test_string_trim();
void test_string_to_lower();
void test_string_parse_int();
void test_logger_parse_level();
void test_logger_threshold();
void test_scheduler_wait_idle();
void test_scheduler_propagates_failure();
void test_scheduler_zero_threads();

// Crypto Subsystem (crypto_test.cpp)
void test_base36_encode_u64();
void test_base36_encode_bytes();
void test_base36_width();
void test_base36_is_digits();
void test_parse_algorithm();
void test_algorithm_names();
void test_digest_known_answers();
void test_digest_unavailable_in_context();
void test_secure_bytes();
void test_secure_range();
void test_secure_letter();

// Core Subsystem (core_test.cpp)
void test_config_defaults();
void test_config_rejects_length();
void test_config_rejects_empty_fingerprint();
void test_config_rejects_unknown_algorithm();
void test_config_validation_order();
void test_counter_sequence();
void test_counter_random_seed();
void test_counter_wraparound();
void test_counter_concurrent_distinct();
void test_fingerprint_default();
void test_fingerprint_rejects_empty_identity();
void test_generator_default_token();
void test_generator_format_all_configurations();
void test_generator_rejects_invalid_arguments();
void test_generator_explicit_fingerprint();
void test_generator_instances_independent();
void test_generator_with_fallback();
void test_generator_algorithm_unavailable();
void test_generator_fallback_retries_alternate();
void test_generator_uniqueness();
void test_generator_distribution();
void test_generator_concurrent();
void test_is_token();

// App Subsystem (app_test.cpp)
void test_settings_defaults();
void test_settings_merge_json();
void test_settings_non_integer_length();
void test_settings_out_of_range_length();
void test_settings_rejects_bad_values();
void test_settings_flags_override_file();
void test_settings_validate_and_help();
void test_settings_option_values_not_scanned();
void test_batch_generation();
void test_render_text();
void test_render_json();

/**
 * @brief Test Suite Execution Entry Point.
 *
 * @return
 * - 0: All tests passed (Success).
 * - 1: One or more assertions failed (Exit failure for CI pipelines).
 */
int main()
{
    std::cout << "\033[36mInitiating Kestrel Test Suite...\033[0m" << std::endl;

    // Keep generator diagnostics out of the report.
    kestrel::infra::Logger::set_level(kestrel::infra::LogLevel::ERROR);

    // --- 1. Infrastructure Subsystem Tests ---
    RUN_TEST(test_string_trim);
    RUN_TEST(test_string_to_lower);
    RUN_TEST(test_string_parse_int);
    RUN_TEST(test_logger_parse_level);
    RUN_TEST(test_logger_threshold);
    RUN_TEST(test_scheduler_wait_idle);
    RUN_TEST(test_scheduler_propagates_failure);
    RUN_TEST(test_scheduler_zero_threads);

    // --- 2. Crypto Subsystem Tests ---
    // Entropy source, EVP digests and the base-36 codec.
    RUN_TEST(test_base36_encode_u64);
    RUN_TEST(test_base36_encode_bytes);
    RUN_TEST(test_base36_width);
    RUN_TEST(test_base36_is_digits);
    RUN_TEST(test_parse_algorithm);
    RUN_TEST(test_algorithm_names);
    RUN_TEST(test_digest_known_answers);
    RUN_TEST(test_digest_unavailable_in_context);
    RUN_TEST(test_secure_bytes);
    RUN_TEST(test_secure_range);
    RUN_TEST(test_secure_letter);

    // --- 3. Core Subsystem Tests ---
    RUN_TEST(test_config_defaults);
    RUN_TEST(test_config_rejects_length);
    RUN_TEST(test_config_rejects_empty_fingerprint);
    RUN_TEST(test_config_rejects_unknown_algorithm);
    RUN_TEST(test_config_validation_order);
    RUN_TEST(test_counter_sequence);
    RUN_TEST(test_counter_random_seed);
    RUN_TEST(test_counter_wraparound);
    RUN_TEST(test_counter_concurrent_distinct);
    RUN_TEST(test_fingerprint_default);
    RUN_TEST(test_fingerprint_rejects_empty_identity);
    RUN_TEST(test_generator_default_token);
    RUN_TEST(test_generator_format_all_configurations);
    RUN_TEST(test_generator_rejects_invalid_arguments);
    RUN_TEST(test_generator_explicit_fingerprint);
    RUN_TEST(test_generator_instances_independent);
    RUN_TEST(test_generator_with_fallback);
    RUN_TEST(test_generator_algorithm_unavailable);
    RUN_TEST(test_generator_fallback_retries_alternate);
    RUN_TEST(test_generator_uniqueness);
    RUN_TEST(test_generator_distribution);
    RUN_TEST(test_generator_concurrent);
    RUN_TEST(test_is_token);

    // --- 4. App Subsystem Tests ---
    // Settings layering (JSON file + flags) and batch output.
    RUN_TEST(test_settings_defaults);
    RUN_TEST(test_settings_merge_json);
    RUN_TEST(test_settings_non_integer_length);
    RUN_TEST(test_settings_out_of_range_length);
    RUN_TEST(test_settings_rejects_bad_values);
    RUN_TEST(test_settings_flags_override_file);
    RUN_TEST(test_settings_validate_and_help);
    RUN_TEST(test_settings_option_values_not_scanned);
    RUN_TEST(test_batch_generation);
    RUN_TEST(test_render_text);
    RUN_TEST(test_render_json);

    kestrel::test::print_summary();

    return (kestrel::test::failed_count == 0) ? 0 : 1;
}
