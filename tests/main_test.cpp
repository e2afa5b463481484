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
 * @brief Central orchestrator for the SCRU128 test suite.
 *
 * @details
 * Aggregates the codec, value type, generator, JSON and infrastructure suites
 * into one executable.
 */

#include "framework.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================
// Implemented in their respective translation units.

// Base36 codec (base36_test.cpp)
void test_base36_boundaries();
void test_base36_matches_reference();
void test_base36_rejects_overflow();
void test_base36_rejects_invalid_digits();

// Id value type (id_test.cpp)
void test_id_encode_decode_vectors();
void test_id_byte_layout();
void test_id_rejects_out_of_range();
void test_id_parse_rejects_malformed();
void test_id_string_round_trip();
void test_id_comparison_operators();

// Generator state machine (generator_test.cpp)
void test_generator_reset_core_monotonic_burst();
void test_generator_abort_core_monotonic_burst();
void test_generator_reset_core_rollback();
void test_generator_abort_core_rollback();
void test_generator_counter_carry();
void test_generator_counter_hi_refresh();
void test_generator_rejects_invalid_arguments();
void test_generator_uses_wall_clock();
void test_generator_concurrent_uniqueness();

// JSON form (json_test.cpp)
void test_json_encode_as_string();
void test_json_decode_accepted_shapes();
void test_json_decode_rejects_other_shapes();
void test_json_describe_fields();

// Infrastructure and default surface (infra_test.cpp)
void test_string_trim();
void test_string_split_whitespace();
void test_system_random_varies();
void test_logger_threshold();
void test_default_generator_strings();
void test_default_generator_ids();

/**
 * @brief Test Suite Execution Entry Point.
 *
 * @return 0 if every test passed, 1 otherwise.
 */
int main()
{
    std::cout << "\033[36mInitiating SCRU128 Test Suite...\033[0m" << std::endl;

    // --- 1. Codec ---
    RUN_TEST(test_base36_boundaries);
    RUN_TEST(test_base36_matches_reference);
    RUN_TEST(test_base36_rejects_overflow);
    RUN_TEST(test_base36_rejects_invalid_digits);

    // --- 2. Value Type ---
    RUN_TEST(test_id_encode_decode_vectors);
    RUN_TEST(test_id_byte_layout);
    RUN_TEST(test_id_rejects_out_of_range);
    RUN_TEST(test_id_parse_rejects_malformed);
    RUN_TEST(test_id_string_round_trip);
    RUN_TEST(test_id_comparison_operators);

    // --- 3. Generator ---
    RUN_TEST(test_generator_reset_core_monotonic_burst);
    RUN_TEST(test_generator_abort_core_monotonic_burst);
    RUN_TEST(test_generator_reset_core_rollback);
    RUN_TEST(test_generator_abort_core_rollback);
    RUN_TEST(test_generator_counter_carry);
    RUN_TEST(test_generator_counter_hi_refresh);
    RUN_TEST(test_generator_rejects_invalid_arguments);
    RUN_TEST(test_generator_uses_wall_clock);
    RUN_TEST(test_generator_concurrent_uniqueness);

    // --- 4. JSON ---
    RUN_TEST(test_json_encode_as_string);
    RUN_TEST(test_json_decode_accepted_shapes);
    RUN_TEST(test_json_decode_rejects_other_shapes);
    RUN_TEST(test_json_describe_fields);

    // --- 5. Infrastructure ---
    RUN_TEST(test_string_trim);
    RUN_TEST(test_string_split_whitespace);
    RUN_TEST(test_system_random_varies);
    RUN_TEST(test_logger_threshold);
    RUN_TEST(test_default_generator_strings);
    RUN_TEST(test_default_generator_ids);

    scru128::test::print_summary();

    return (scru128::test::failed_count == 0) ? 0 : 1;
}
