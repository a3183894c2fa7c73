#pragma once

#include <relay/circuit_breaker.hpp>
#include <relay/config.hpp>
#include <relay/provider.hpp>
#include <relay/provider_metrics.hpp>
#include <relay/result.hpp>
#include <relay/routing_engine.hpp>

#include <memory>
#include <unordered_map>
#include <vector>

namespace relay {

/**
 * ProviderRegistry - Fixed table of providers with their breakers and metrics.
 *
 * Built once at startup and never mutated afterwards, so it is shared by
 * reference across dispatching threads without locking. Per-provider state
 * (breaker, metrics) synchronizes itself.
 */
class ProviderRegistry {
public:
    struct Entry {
        ProviderPtr provider;
        std::unique_ptr<CircuitBreaker> breaker;
        ProviderMetrics* metrics = nullptr;
    };

    /**
     * Build the registry.
     *
     * @param providers Providers in registration order (also the tie-break order)
     * @param breaker_config Configuration applied to every provider's breaker
     * @return Registry, or INVALID_ARGUMENT for an empty list, null entry,
     *         empty id or duplicate id
     */
    static Result<std::unique_ptr<ProviderRegistry>> create(
        std::vector<ProviderPtr> providers,
        const CircuitBreakerConfig& breaker_config);

    ProviderRegistry(const ProviderRegistry&) = delete;
    ProviderRegistry& operator=(const ProviderRegistry&) = delete;

    /**
     * @return Entry for the provider, or nullptr if not registered
     */
    Entry* find(const ProviderId& provider);
    const Entry* find(const ProviderId& provider) const;

    const std::vector<Entry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }

    ProviderMetricsStore& metrics() { return *metrics_; }
    const ProviderMetricsStore& metrics() const { return *metrics_; }

    /**
     * Capture metrics and breaker eligibility for every provider.
     * Eligibility checks may move Open breakers to HalfOpen.
     */
    RoutingSnapshot snapshot();

private:
    ProviderRegistry() = default;

    std::vector<Entry> entries_;
    std::unordered_map<ProviderId, size_t> index_;
    std::unique_ptr<ProviderMetricsStore> metrics_;
};

}  // namespace relay
