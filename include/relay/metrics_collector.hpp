#pragma once

#include <relay/types.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace relay {

// ============================================================================
// Metrics Export
// ============================================================================

/**
 * Live routing inputs for one provider at snapshot time.
 */
struct ProviderHealth {
    ProviderId provider;
    std::string breaker_state;
    double success_rate = 0.0;
    double latency_ms = 0.0;
    double quality_score = 0.0;
    double cost_per_token = 0.0;
    uint64_t requests = 0;
    uint64_t errors = 0;
    int64_t last_success_unix_ms = 0;
    uint64_t breaker_transitions = 0;
};

/**
 * Point-in-time report for an external monitoring collaborator.
 */
struct MetricsSnapshot {
    uint64_t total_requests = 0;
    uint64_t successful_requests = 0;
    uint64_t failed_requests = 0;
    uint64_t cache_hits = 0;

    double average_latency_ms = 0.0;
    double p95_latency_ms = 0.0;
    double p99_latency_ms = 0.0;

    double total_cost_usd = 0.0;
    double requests_per_second = 0.0;
    double uptime_seconds = 0.0;

    std::map<ProviderId, uint64_t> provider_distribution;
    std::map<ProviderId, std::string> circuit_breaker_states;
    std::vector<ProviderHealth> provider_health;  // Registration order

    std::string to_json(int indent = 2) const;
};

struct LatencyStats {
    size_t samples = 0;
    double mean_ms = 0.0;
    double p95_ms = 0.0;
    double p99_ms = 0.0;
};

// ============================================================================
// MetricsCollector
// ============================================================================

/**
 * MetricsCollector - Request totals and a bounded latency window.
 *
 * Counters are atomics. The latency window is a deque behind a mutex held
 * only to append or copy; percentiles are computed on the copy.
 */
class MetricsCollector {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @param window_size Latency samples kept (oldest dropped first)
     * @param providers Providers tracked in the distribution
     */
    MetricsCollector(size_t window_size, const std::vector<ProviderId>& providers);

    MetricsCollector(const MetricsCollector&) = delete;
    MetricsCollector& operator=(const MetricsCollector&) = delete;

    // Terminal outcomes, one call per request
    void record_success(const ProviderId& provider, uint64_t latency_ms, double cost_usd);
    void record_cache_hit(double cost_usd);
    void record_failure();

    void record_latency(uint64_t latency_ms);

    LatencyStats latency_stats() const;

    /**
     * Fill the totals, latency and distribution fields. Breaker states and
     * provider health are left to the caller.
     */
    MetricsSnapshot snapshot() const;

    /**
     * Value at index floor(n * q) of a sorted sample set (clamped to the
     * last element). Returns 0 for an empty set.
     */
    static double percentile(const std::vector<uint64_t>& sorted, double q);

    size_t window_size() const { return window_size_; }

private:
    size_t window_size_;
    Clock::time_point started_at_;

    std::atomic<uint64_t> total_{0};
    std::atomic<uint64_t> successes_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> cost_micros_{0};  // USD * 1e6

    // Fixed at construction; map itself is never mutated afterwards
    std::vector<ProviderId> provider_order_;
    std::unordered_map<ProviderId, std::unique_ptr<std::atomic<uint64_t>>> per_provider_;

    mutable std::mutex window_mutex_;
    std::deque<uint64_t> latencies_;

    void add_cost(double cost_usd);
};

}  // namespace relay
