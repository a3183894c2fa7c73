#pragma once

#include <relay/circuit_breaker.hpp>
#include <relay/config.hpp>
#include <relay/provider_metrics.hpp>
#include <relay/result.hpp>
#include <relay/types.hpp>

#include <cstdint>
#include <unordered_set>
#include <vector>

namespace relay {

/**
 * One provider as seen by the router at snapshot time.
 */
struct ProviderSnapshot {
    ProviderMetricsSnapshot metrics;
    CircuitState breaker_state = CircuitState::CLOSED;
    bool eligible = false;  // Breaker would admit a call
};

/**
 * Read-only view of all registered providers, in registration order.
 */
struct RoutingSnapshot {
    std::vector<ProviderSnapshot> providers;
    int64_t taken_at_unix_ms = 0;
};

struct ProviderScore {
    ProviderId provider;
    size_t registration_index = 0;
    double overall = 0.0;
    double cost = 0.0;
    double latency = 0.0;
    double quality = 0.0;
    double reliability = 0.0;
};

/**
 * RoutingEngine - Weighted multi-dimensional provider selection.
 *
 * Stateless apart from its weights, so a single instance is shared by all
 * dispatching threads. Operates purely on snapshots; selection over the same
 * snapshot is deterministic.
 */
class RoutingEngine {
public:
    static constexpr double REFERENCE_COST_USD = 0.01;
    static constexpr double HIGH_PRIORITY_TARGET_MS = 100.0;
    static constexpr double NORMAL_TARGET_MS = 200.0;
    static constexpr double FRESHNESS_DECAY_SECONDS = 300.0;

    explicit RoutingEngine(RoutingWeights weights = {});

    /**
     * Score one provider for a request.
     *
     * @param now_unix_ms Reference time for the freshness decay
     */
    ProviderScore score(const Request& request,
                        const ProviderSnapshot& provider,
                        int64_t now_unix_ms) const;

    /**
     * Score every eligible provider, best first. Equal scores keep
     * registration order.
     */
    std::vector<ProviderScore> rank(const Request& request,
                                    const RoutingSnapshot& snapshot) const;

    /**
     * Pick the best eligible provider that is not excluded.
     *
     * @return Provider id, or NO_PROVIDERS_AVAILABLE
     */
    Result<ProviderId> select(const Request& request,
                              const RoutingSnapshot& snapshot,
                              const std::unordered_set<ProviderId>& excluded = {}) const;

    /**
     * Relative price of the requested model tier.
     */
    static double size_multiplier(const std::optional<ModelSize>& size);

    /**
     * Expected cost of serving a request at the given per-token price.
     */
    static double estimate_cost(const Request& request, double cost_per_token);

    const RoutingWeights& weights() const { return weights_; }

private:
    RoutingWeights weights_;
};

}  // namespace relay
