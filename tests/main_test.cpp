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
 * @brief Central orchestrator for the uuidmesh test suite.
 *
 * @details
 * Aggregates unit and integration tests across the subsystems: Infrastructure,
 * HTTP codec and router, UUID service, gateway (health, cache, config, proxy)
 * and the loopback integration tests.
 */

#include "framework.hpp"
#include "uuidmesh/infra/logger.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================
// The following test functions are implemented in their respective
// translation units (e.g., infra_test.cpp, proxy_test.cpp, etc.).

// Infrastructure (infra_test.cpp)
void test_uuid_length();
void test_uuid_version_and_variant();
void test_uuid_uniqueness();
void test_uuid_unique_across_threads();
void test_uuid_validation_rejects_malformed();
void test_string_trim();
void test_string_trim_empty();
void test_string_split_keeps_empty_fields();
void test_string_case_helpers();
void test_string_url_decode();
void test_string_parse_uint();
void test_log_level_parsing();
void test_event_formatting();
void test_scheduler_runs_tasks();
void test_scheduler_grows_when_all_busy();
void test_scheduler_respects_ceiling();

// HTTP codec and router (http_test.cpp)
void test_parse_request_split_across_reads();
void test_parse_request_pipelined();
void test_parse_request_rejects_oversized_header();
void test_parse_request_rejects_malformed();
void test_query_param_presence();
void test_keep_alive_defaults();
void test_serialize_response_content_length();
void test_serialize_empty_error_body();
void test_parse_response_chunked();
void test_parse_response_close_delimited();
void test_parse_response_truncated_body();
void test_error_body_shape();
void test_router_binds_path_parameters();
void test_router_not_found_and_method_mismatch();
void test_router_rejects_bad_pattern();

// UUID service (service_test.cpp)
void test_get_uuid_returns_v4_and_instance();
void test_consecutive_uuids_differ();
void test_query_id_variants();
void test_path_id_variant();
void test_compose_message();
void test_slow_endpoint_waits();
void test_forced_error_endpoint();
void test_forced_error_can_be_disabled();
void test_health_endpoint();
void test_service_config_defaults();
void test_service_config_overrides();
void test_service_config_rejects_bad_values();

// Health tracker (health_test.cpp)
void test_health_evicts_after_max_fails();
void test_health_probes_after_cooldown();
void test_health_probe_failure_reevicts();
void test_health_success_resets_streak();
void test_health_fail_window_restarts_streak();
void test_health_failures_while_unavailable_do_not_extend();
void test_health_concurrent_updates();

// Response cache (cache_test.cpp)
void test_cache_key_components();
void test_cache_key_header_variance();
void test_cache_fresh_then_stale_then_gone();
void test_cache_store_replaces();
void test_cache_evicts_when_full();

// Gateway configuration (config_test.cpp)
void test_config_parses_full_document();
void test_config_attempt_budget_defaults_to_replica_count();
void test_config_rejects_bad_rewrite();
void test_config_rejects_unknown_upstream();
void test_config_rejects_empty_replicas();
void test_config_rejects_structural_errors();
void test_config_rejects_out_of_range_numbers();
void test_config_load_from_file();

// Gateway pipeline (proxy_test.cpp)
void test_proxy_round_robin();
void test_proxy_fails_over_to_next_replica();
void test_proxy_excludes_until_cooldown_then_probes();
void test_proxy_counts_5xx_as_failure();
void test_proxy_5xx_ignored_when_disabled();
void test_proxy_502_on_connect_failures();
void test_proxy_504_when_last_attempt_timed_out();
void test_proxy_respects_max_attempts();
void test_proxy_cache_hit_within_validity();
void test_proxy_cache_skips_non_get_and_errors();
void test_proxy_shipped_config_caches_only_get_id();
void test_proxy_serves_stale_when_upstream_fails();
void test_proxy_rewrites_and_forwards_headers();
void test_proxy_preserves_path_without_rewrite();
void test_proxy_longest_prefix_wins();
void test_proxy_unknown_route_is_404();
void test_proxy_status_endpoint();
void test_proxy_emits_request_events();

// Loopback integration (server_test.cpp)
void test_loopback_service_roundtrip();
void test_loopback_gateway_to_service();
void test_slow_requests_do_not_block_others();
void test_client_reports_connect_failure();
void test_client_read_timeout();

/**
 * @brief Test Suite Execution Entry Point.
 *
 * @return
 * - 0: All tests passed (Success).
 * - 1: One or more assertions failed (Exit failure for CI pipelines).
 */
int main()
{
    std::cout << "\033[36mInitiating uuidmesh Test Suite...\033[0m" << std::endl;

    // Keep transition logs out of the report.
    uuidmesh::infra::Logger::set_threshold(uuidmesh::infra::LogLevel::FATAL);

    // --- 1. Infrastructure ---
    RUN_TEST(test_uuid_length);
    RUN_TEST(test_uuid_version_and_variant);
    RUN_TEST(test_uuid_uniqueness);
    RUN_TEST(test_uuid_unique_across_threads);
    RUN_TEST(test_uuid_validation_rejects_malformed);
    RUN_TEST(test_string_trim);
    RUN_TEST(test_string_trim_empty);
    RUN_TEST(test_string_split_keeps_empty_fields);
    RUN_TEST(test_string_case_helpers);
    RUN_TEST(test_string_url_decode);
    RUN_TEST(test_string_parse_uint);
    RUN_TEST(test_log_level_parsing);
    RUN_TEST(test_event_formatting);
    RUN_TEST(test_scheduler_runs_tasks);
    RUN_TEST(test_scheduler_grows_when_all_busy);
    RUN_TEST(test_scheduler_respects_ceiling);

    // --- 2. HTTP Codec & Router ---
    RUN_TEST(test_parse_request_split_across_reads);
    RUN_TEST(test_parse_request_pipelined);
    RUN_TEST(test_parse_request_rejects_oversized_header);
    RUN_TEST(test_parse_request_rejects_malformed);
    RUN_TEST(test_query_param_presence);
    RUN_TEST(test_keep_alive_defaults);
    RUN_TEST(test_serialize_response_content_length);
    RUN_TEST(test_serialize_empty_error_body);
    RUN_TEST(test_parse_response_chunked);
    RUN_TEST(test_parse_response_close_delimited);
    RUN_TEST(test_parse_response_truncated_body);
    RUN_TEST(test_error_body_shape);
    RUN_TEST(test_router_binds_path_parameters);
    RUN_TEST(test_router_not_found_and_method_mismatch);
    RUN_TEST(test_router_rejects_bad_pattern);

    // --- 3. UUID Service ---
    RUN_TEST(test_get_uuid_returns_v4_and_instance);
    RUN_TEST(test_consecutive_uuids_differ);
    RUN_TEST(test_query_id_variants);
    RUN_TEST(test_path_id_variant);
    RUN_TEST(test_compose_message);
    RUN_TEST(test_slow_endpoint_waits);
    RUN_TEST(test_forced_error_endpoint);
    RUN_TEST(test_forced_error_can_be_disabled);
    RUN_TEST(test_health_endpoint);
    RUN_TEST(test_service_config_defaults);
    RUN_TEST(test_service_config_overrides);
    RUN_TEST(test_service_config_rejects_bad_values);

    // --- 4. Gateway Components ---
    RUN_TEST(test_health_evicts_after_max_fails);
    RUN_TEST(test_health_probes_after_cooldown);
    RUN_TEST(test_health_probe_failure_reevicts);
    RUN_TEST(test_health_success_resets_streak);
    RUN_TEST(test_health_fail_window_restarts_streak);
    RUN_TEST(test_health_failures_while_unavailable_do_not_extend);
    RUN_TEST(test_health_concurrent_updates);
    RUN_TEST(test_cache_key_components);
    RUN_TEST(test_cache_key_header_variance);
    RUN_TEST(test_cache_fresh_then_stale_then_gone);
    RUN_TEST(test_cache_store_replaces);
    RUN_TEST(test_cache_evicts_when_full);
    RUN_TEST(test_config_parses_full_document);
    RUN_TEST(test_config_attempt_budget_defaults_to_replica_count);
    RUN_TEST(test_config_rejects_bad_rewrite);
    RUN_TEST(test_config_rejects_unknown_upstream);
    RUN_TEST(test_config_rejects_empty_replicas);
    RUN_TEST(test_config_rejects_structural_errors);
    RUN_TEST(test_config_rejects_out_of_range_numbers);
    RUN_TEST(test_config_load_from_file);

    // --- 5. Gateway Pipeline ---
    RUN_TEST(test_proxy_round_robin);
    RUN_TEST(test_proxy_fails_over_to_next_replica);
    RUN_TEST(test_proxy_excludes_until_cooldown_then_probes);
    RUN_TEST(test_proxy_counts_5xx_as_failure);
    RUN_TEST(test_proxy_5xx_ignored_when_disabled);
    RUN_TEST(test_proxy_502_on_connect_failures);
    RUN_TEST(test_proxy_504_when_last_attempt_timed_out);
    RUN_TEST(test_proxy_respects_max_attempts);
    RUN_TEST(test_proxy_cache_hit_within_validity);
    RUN_TEST(test_proxy_cache_skips_non_get_and_errors);
    RUN_TEST(test_proxy_shipped_config_caches_only_get_id);
    RUN_TEST(test_proxy_serves_stale_when_upstream_fails);
    RUN_TEST(test_proxy_rewrites_and_forwards_headers);
    RUN_TEST(test_proxy_preserves_path_without_rewrite);
    RUN_TEST(test_proxy_longest_prefix_wins);
    RUN_TEST(test_proxy_unknown_route_is_404);
    RUN_TEST(test_proxy_status_endpoint);
    RUN_TEST(test_proxy_emits_request_events);

    // --- 6. Loopback Integration ---
    RUN_TEST(test_loopback_service_roundtrip);
    RUN_TEST(test_loopback_gateway_to_service);
    RUN_TEST(test_slow_requests_do_not_block_others);
    RUN_TEST(test_client_reports_connect_failure);
    RUN_TEST(test_client_read_timeout);

    uuidmesh::test::print_summary();

    return (uuidmesh::test::failed_count == 0) ? 0 : 1;
}
