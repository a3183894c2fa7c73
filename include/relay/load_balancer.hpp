#pragma once

#include <relay/admission.hpp>
#include <relay/budget_tracker.hpp>
#include <relay/circuit_breaker.hpp>
#include <relay/config.hpp>
#include <relay/metrics_collector.hpp>
#include <relay/provider.hpp>
#include <relay/provider_registry.hpp>
#include <relay/request_cache.hpp>
#include <relay/result.hpp>
#include <relay/retry_controller.hpp>
#include <relay/routing_engine.hpp>
#include <relay/types.hpp>

#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace relay {

/**
 * LoadBalancer - Public entry point composing routing and fault tolerance.
 *
 * complete() runs: validation, admission, cache lookup, budget reservation,
 * routed dispatch with retries, then budget commit, metrics and cache
 * population. Safe to call from many threads at once.
 *
 * Usage:
 *   auto lb = LoadBalancer::create(config, {openai, claude});
 *   if (!lb) { ... }
 *   auto response = (*lb)->complete(request);
 */
class LoadBalancer {
public:
    /**
     * Validate the configuration and build the provider registry.
     *
     * @return Load balancer, or INVALID_ARGUMENT
     */
    static Result<std::unique_ptr<LoadBalancer>> create(LoadBalancerConfig config,
                                                        std::vector<ProviderPtr> providers);

    LoadBalancer(const LoadBalancer&) = delete;
    LoadBalancer& operator=(const LoadBalancer&) = delete;

    /**
     * Serve a request.
     *
     * @return Response, or one of INVALID_REQUEST, OVERLOADED,
     *         NO_PROVIDERS_AVAILABLE, COST_BUDGET_EXCEEDED,
     *         CIRCUIT_BREAKER_OPEN, MAX_RETRIES_EXCEEDED or a permanent
     *         provider error
     */
    Result<Response> complete(const Request& request);

    // ========================================================================
    // Introspection
    // ========================================================================

    MetricsSnapshot metrics() const;

    /**
     * Score every eligible provider for a request, best first.
     */
    std::vector<ProviderScore> rank(const Request& request);

    /**
     * Run each provider's health probe. Breakers are not touched.
     */
    std::map<ProviderId, bool> check_health();

    std::optional<CircuitState> breaker_state(const ProviderId& provider) const;

    // ========================================================================
    // Runtime overrides
    // ========================================================================

    Result<void> set_quality_score(const ProviderId& provider, double quality_score);
    Result<void> set_cost_per_token(const ProviderId& provider, double cost_per_token);
    Result<void> reset_breaker(const ProviderId& provider);

    size_t purge_cache() { return cache_.purge_expired(); }
    void clear_cache() { cache_.clear(); }

    const LoadBalancerConfig& config() const { return config_; }
    const BudgetTracker& budget() const { return budget_; }
    const RequestCache& cache() const { return cache_; }
    const AdmissionGate& admission() const { return gate_; }

private:
    LoadBalancer(LoadBalancerConfig config, std::unique_ptr<ProviderRegistry> registry);

    LoadBalancerConfig config_;
    std::unique_ptr<ProviderRegistry> registry_;
    RoutingEngine router_;
    RetryController retry_;
    RequestCache cache_;
    BudgetTracker budget_;
    MetricsCollector metrics_;
    AdmissionGate gate_;

    Result<void> validate(const Request& request) const;
    double estimate_cost(const Request& request, const RoutingSnapshot& snapshot) const;
    Result<Response> fail(Error error);
};

}  // namespace relay
