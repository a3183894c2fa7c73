#pragma once

#include <relay/types.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace relay {

/**
 * Point-in-time copy of one provider's live metrics.
 */
struct ProviderMetricsSnapshot {
    ProviderId provider;
    double cost_per_token = 0.0;
    double latency_ms = 0.0;          // EWMA of successful call latency
    double quality_score = 0.0;       // 0..1
    double success_rate = 0.0;        // 0..1, EWMA over outcomes
    int64_t last_success_unix_ms = 0;
    uint64_t requests = 0;
    uint64_t errors = 0;
};

/**
 * ProviderMetrics - Lock-free live counters for one provider.
 *
 * Every field is a single atomic so the routing engine can read without
 * blocking writers. Fields are updated independently; a snapshot may mix
 * values from neighbouring updates.
 */
class ProviderMetrics {
public:
    // Starting estimates before any traffic has been observed
    static constexpr double INITIAL_LATENCY_MS = 100.0;
    static constexpr double INITIAL_SUCCESS_RATE = 0.99;
    static constexpr double INITIAL_QUALITY = 0.85;

    // Smoothing factors (weight of the newest sample)
    static constexpr double LATENCY_ALPHA = 0.1;
    static constexpr double SUCCESS_ALPHA = 0.01;
    static constexpr double QUALITY_ALPHA = 0.1;

    ProviderMetrics(ProviderId provider, double cost_per_token);

    ProviderMetrics(const ProviderMetrics&) = delete;
    ProviderMetrics& operator=(const ProviderMetrics&) = delete;

    void record_success(uint64_t latency_ms, std::optional<double> quality_score = std::nullopt);
    void record_failure();

    // Runtime overrides
    void set_cost_per_token(double cost_per_token);
    void set_quality_score(double quality_score);

    ProviderMetricsSnapshot snapshot() const;

    const ProviderId& provider() const { return provider_; }

private:
    ProviderId provider_;
    std::atomic<double> cost_per_token_;
    std::atomic<double> latency_ms_{INITIAL_LATENCY_MS};
    std::atomic<double> quality_score_{INITIAL_QUALITY};
    std::atomic<double> success_rate_{INITIAL_SUCCESS_RATE};
    std::atomic<int64_t> last_success_unix_ms_;
    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> errors_{0};
};

/**
 * ProviderMetricsStore - Owns one ProviderMetrics per registered provider.
 *
 * The provider set is fixed at construction; lookups never lock.
 */
class ProviderMetricsStore {
public:
    struct Registration {
        ProviderId provider;
        double cost_per_token = 0.0;
    };

    explicit ProviderMetricsStore(const std::vector<Registration>& providers);

    ProviderMetricsStore(const ProviderMetricsStore&) = delete;
    ProviderMetricsStore& operator=(const ProviderMetricsStore&) = delete;

    /**
     * @return The provider's metrics, or nullptr if not registered
     */
    ProviderMetrics* get(const ProviderId& provider);
    const ProviderMetrics* get(const ProviderId& provider) const;

    /**
     * Snapshots of all providers in registration order.
     */
    std::vector<ProviderMetricsSnapshot> snapshot_all() const;

    size_t size() const { return ordered_.size(); }

private:
    std::vector<std::unique_ptr<ProviderMetrics>> ordered_;
    std::unordered_map<ProviderId, ProviderMetrics*> by_id_;
};

/**
 * Milliseconds since the Unix epoch on the system clock.
 */
int64_t unix_now_ms();

}  // namespace relay
