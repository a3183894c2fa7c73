#include <relay/load_balancer.hpp>
#include <relay/util/logger.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace relay {

namespace {

std::vector<ProviderId> provider_ids(const ProviderRegistry& registry) {
    std::vector<ProviderId> ids;
    ids.reserve(registry.size());
    for (const auto& entry : registry.entries()) {
        ids.push_back(entry.breaker->provider());
    }
    return ids;
}

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

// Releases a budget reservation that was not committed by scope exit
class ReservationGuard {
public:
    ReservationGuard(BudgetTracker& budget, BudgetTracker::Reservation& reservation)
        : budget_(budget), reservation_(reservation) {}

    ~ReservationGuard() { budget_.release(reservation_); }

    ReservationGuard(const ReservationGuard&) = delete;
    ReservationGuard& operator=(const ReservationGuard&) = delete;

private:
    BudgetTracker& budget_;
    BudgetTracker::Reservation& reservation_;
};

}  // namespace

// ============================================================================
// Construction
// ============================================================================

Result<std::unique_ptr<LoadBalancer>> LoadBalancer::create(LoadBalancerConfig config,
                                                           std::vector<ProviderPtr> providers) {
    auto valid = validate_config(config);
    if (!valid) {
        return valid.error();
    }

    auto registry = ProviderRegistry::create(std::move(providers), config.circuit_breaker);
    if (!registry) {
        return registry.error();
    }

    std::unique_ptr<LoadBalancer> lb(new LoadBalancer(std::move(config), std::move(registry).value()));

    std::ostringstream ss;
    ss << "load balancer ready with " << lb->registry_->size() << " providers";
    logger()->info(ss.str());

    return std::move(lb);
}

LoadBalancer::LoadBalancer(LoadBalancerConfig config, std::unique_ptr<ProviderRegistry> registry)
    : config_(std::move(config))
    , registry_(std::move(registry))
    , router_(config_.routing)
    , retry_(*registry_, router_, config_.retry, config_.admission.max_concurrent_requests)
    , cache_(config_.cache)
    , budget_(config_.budget)
    , metrics_(config_.metrics_window_size, provider_ids(*registry_))
    , gate_(config_.admission)
{}

// ============================================================================
// Request Path
// ============================================================================

Result<void> LoadBalancer::validate(const Request& request) const {
    if (is_blank(request.prompt)) {
        return Error(ErrorCode::INVALID_REQUEST, "Prompt is empty");
    }
    if (request.max_tokens && *request.max_tokens == 0) {
        return Error(ErrorCode::INVALID_REQUEST, "max_tokens must be positive");
    }
    if (request.temperature &&
        (!std::isfinite(*request.temperature) || *request.temperature < 0.0)) {
        return Error(ErrorCode::INVALID_REQUEST, "temperature must be a non-negative number");
    }
    return Ok();
}

double LoadBalancer::estimate_cost(const Request& request, const RoutingSnapshot& snapshot) const {
    // Cheapest eligible provider; the router may still pick a pricier one
    double best = std::numeric_limits<double>::max();
    for (const auto& provider : snapshot.providers) {
        if (!provider.eligible) continue;
        best = std::min(best, RoutingEngine::estimate_cost(request, provider.metrics.cost_per_token));
    }
    return best == std::numeric_limits<double>::max() ? 0.0 : best;
}

Result<Response> LoadBalancer::fail(Error error) {
    metrics_.record_failure();
    logger()->warning("request failed: " + error.to_string());
    return error;
}

Result<Response> LoadBalancer::complete(const Request& request) {
    auto valid = validate(request);
    if (!valid) {
        return valid.error();
    }

    auto ticket = gate_.acquire();
    if (!ticket) {
        return fail(ticket.error());
    }

    // Check cache first
    uint64_t fingerprint = 0;
    if (cache_.enabled()) {
        fingerprint = request_fingerprint(request);
        if (auto cached = cache_.get(fingerprint)) {
            cached->id = request.id;
            metrics_.record_cache_hit(cached->cost_usd);
            return *cached;
        }
    }

    RoutingSnapshot snapshot = registry_->snapshot();
    bool any_eligible = std::any_of(snapshot.providers.begin(), snapshot.providers.end(),
        [](const ProviderSnapshot& p) { return p.eligible; });
    if (!any_eligible) {
        return fail(Error(ErrorCode::NO_PROVIDERS_AVAILABLE, "All provider circuit breakers are open"));
    }

    auto reservation = budget_.try_reserve(estimate_cost(request, snapshot));
    if (!reservation) {
        return fail(reservation.error());
    }
    ReservationGuard reservation_guard(budget_, *reservation);

    uint64_t timeout_ms = request.timeout_ms > 0 ? request.timeout_ms : config_.default_timeout_ms;
    auto result = retry_.dispatch(request, std::chrono::milliseconds(timeout_ms), snapshot);

    if (!result) {
        return fail(result.error());
    }

    budget_.commit(*reservation, result->cost_usd);
    metrics_.record_success(result->provider, result->latency_ms, result->cost_usd);

    if (cache_.enabled()) {
        cache_.put(fingerprint, *result);
    }

    return result;
}

// ============================================================================
// Introspection
// ============================================================================

MetricsSnapshot LoadBalancer::metrics() const {
    MetricsSnapshot snap = metrics_.snapshot();

    for (const auto& entry : registry_->entries()) {
        const ProviderId& id = entry.breaker->provider();
        const char* state = circuit_state_name(entry.breaker->state());
        snap.circuit_breaker_states[id] = state;

        ProviderMetricsSnapshot m = entry.metrics->snapshot();
        ProviderHealth health;
        health.provider = id;
        health.breaker_state = state;
        health.success_rate = m.success_rate;
        health.latency_ms = m.latency_ms;
        health.quality_score = m.quality_score;
        health.cost_per_token = m.cost_per_token;
        health.requests = m.requests;
        health.errors = m.errors;
        health.last_success_unix_ms = m.last_success_unix_ms;
        health.breaker_transitions = entry.breaker->transition_count();
        snap.provider_health.push_back(std::move(health));
    }

    return snap;
}

std::vector<ProviderScore> LoadBalancer::rank(const Request& request) {
    return router_.rank(request, registry_->snapshot());
}

std::map<ProviderId, bool> LoadBalancer::check_health() {
    std::map<ProviderId, bool> results;

    for (const auto& entry : registry_->entries()) {
        const ProviderId& id = entry.breaker->provider();
        bool healthy = false;
        try {
            healthy = entry.provider->health_check();
        } catch (const std::exception& e) {
            logger()->warning("health check for " + id + " threw: " + e.what());
        }
        if (!healthy) {
            logger()->warning("provider " + id + " failed its health check");
        }
        results[id] = healthy;
    }

    return results;
}

std::optional<CircuitState> LoadBalancer::breaker_state(const ProviderId& provider) const {
    const auto* entry = registry_->find(provider);
    if (!entry) {
        return std::nullopt;
    }
    return entry->breaker->state();
}

// ============================================================================
// Runtime Overrides
// ============================================================================

Result<void> LoadBalancer::set_quality_score(const ProviderId& provider, double quality_score) {
    auto* entry = registry_->find(provider);
    if (!entry) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Unknown provider: " + provider);
    }
    entry->metrics->set_quality_score(quality_score);
    return Ok();
}

Result<void> LoadBalancer::set_cost_per_token(const ProviderId& provider, double cost_per_token) {
    auto* entry = registry_->find(provider);
    if (!entry) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Unknown provider: " + provider);
    }
    entry->metrics->set_cost_per_token(cost_per_token);
    return Ok();
}

Result<void> LoadBalancer::reset_breaker(const ProviderId& provider) {
    auto* entry = registry_->find(provider);
    if (!entry) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Unknown provider: " + provider);
    }
    entry->breaker->reset();
    return Ok();
}

}  // namespace relay
