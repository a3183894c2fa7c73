#pragma once

#include <relay/result.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace relay {

// ============================================================================
// Routing Configuration
// ============================================================================

/**
 * Weights of the four scoring dimensions. Expected to sum to 1.0; this is
 * not enforced.
 */
struct RoutingWeights {
    double cost = 0.3;
    double latency = 0.4;
    double quality = 0.2;
    double reliability = 0.1;

    double sum() const { return cost + latency + quality + reliability; }
};

struct CircuitBreakerConfig {
    uint32_t failure_threshold = 5;    // Consecutive failures before opening
    uint32_t success_threshold = 3;    // Consecutive trial successes before closing
    uint64_t timeout_ms = 60000;       // Open -> HalfOpen cooldown
    uint32_t half_open_max_calls = 3;  // Concurrent trials while HalfOpen
};

struct RetryPolicyConfig {
    uint32_t max_retries = 3;          // Attempts after the first one
    uint64_t base_delay_ms = 100;
    uint64_t max_delay_ms = 5000;
    double backoff_multiplier = 2.0;
    bool jitter = true;                // Up to +30% random delay
    bool retry_on_timeout = true;
    bool retry_on_rate_limit = true;
};

struct CacheConfig {
    bool enabled = true;
    uint64_t ttl_seconds = 300;        // 5 minutes
    size_t max_entries = 10000;
    double hit_cost_reduction = 0.05;  // Hit reports cost * factor
    size_t shards = 16;
};

struct BudgetConfig {
    std::optional<double> hourly_budget_usd;  // Unset = unlimited
};

enum class BackpressurePolicy {
    QUEUE,   // Wait up to queue_timeout_ms for a slot
    REJECT   // Fail immediately when the limit is reached
};

struct AdmissionConfig {
    size_t max_concurrent_requests = 1000;
    BackpressurePolicy policy = BackpressurePolicy::QUEUE;
    uint64_t queue_timeout_ms = 1000;
};

struct LoadBalancerConfig {
    uint64_t default_timeout_ms = 30000;  // Used when Request::timeout_ms == 0
    size_t metrics_window_size = 10000;   // Latency samples kept for percentiles

    RoutingWeights routing;
    CircuitBreakerConfig circuit_breaker;
    RetryPolicyConfig retry;
    CacheConfig cache;
    BudgetConfig budget;
    AdmissionConfig admission;
};

// ============================================================================
// Loading
// ============================================================================

/**
 * Parse a configuration from a JSON document.
 *
 * Missing sections and fields keep their defaults. Unknown fields are
 * ignored.
 *
 * @param json_text JSON document text
 * @return The configuration, or INVALID_ARGUMENT describing the first problem
 */
Result<LoadBalancerConfig> config_from_json(const std::string& json_text);

/**
 * Read and parse a JSON configuration file.
 *
 * @return The configuration, IO_ERROR if unreadable, INVALID_ARGUMENT if malformed
 */
Result<LoadBalancerConfig> load_config(const std::filesystem::path& path);

/**
 * Render a configuration as pretty-printed JSON (round-trips through
 * config_from_json).
 */
std::string config_to_json(const LoadBalancerConfig& config);

/**
 * Check value ranges that the components rely on.
 */
Result<void> validate_config(const LoadBalancerConfig& config);

}  // namespace relay
