#pragma once

#include "docflow/config.hpp"
#include "docflow/task_types.hpp"
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

// Test utilities
#define TEST_ASSERT(condition, message) \
    if (!(condition)) { \
        std::cerr << "❌ TEST FAILED: " << message << std::endl; \
        return false; \
    } else { \
        std::cout << "✅ " << message << std::endl; \
    }

namespace docflow_test {

// Database settings from PG_* variables, nullopt when PG_HOST is not set
inline std::optional<docflow::DatabaseConfig> pg_config() {
    if (!std::getenv("PG_HOST")) {
        return std::nullopt;
    }
    auto config = docflow::DatabaseConfig::from_env();
    config.schema = docflow::get_env_string("PG_SCHEMA", "docflow_test");
    config.pool_size = 6;
    config.pool_acquisition_timeout = 5000;
    return config;
}

inline bool skip_without_pg() {
    if (!std::getenv("PG_HOST")) {
        std::cout << "⚠️  Skipping test - PostgreSQL not configured (set PG_HOST env var)" << std::endl;
        return true;
    }
    return false;
}

// Stream and group names no other test run shares
inline docflow::QueueConfig isolated_queue(const std::string& label) {
    docflow::QueueConfig config;
    std::string unique = docflow::generate_task_id();
    config.stream = "test:" + label + ":" + unique;
    config.group = "test-group:" + unique;
    config.block_ms = 500;
    config.poll_interval_ms = 20;
    config.max_poll_interval_ms = 100;
    config.claim_min_idle_ms = 0;
    config.max_retries = 3;
    return config;
}

inline int finish(bool all_passed) {
    std::cout << "\n" << std::string(60, '=') << std::endl;
    if (all_passed) {
        std::cout << "✅ ALL TESTS PASSED!" << std::endl;
        return 0;
    }
    std::cout << "❌ SOME TESTS FAILED" << std::endl;
    return 1;
}

} // namespace docflow_test
