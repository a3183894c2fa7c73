#include <relay/provider_registry.hpp>

namespace relay {

Result<std::unique_ptr<ProviderRegistry>> ProviderRegistry::create(
    std::vector<ProviderPtr> providers,
    const CircuitBreakerConfig& breaker_config) {

    if (providers.empty()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "At least one provider is required");
    }

    std::unique_ptr<ProviderRegistry> registry(new ProviderRegistry());
    std::vector<ProviderMetricsStore::Registration> registrations;

    for (auto& provider : providers) {
        if (!provider) {
            return Error(ErrorCode::INVALID_ARGUMENT, "Null provider");
        }

        ProviderId id = provider->provider_id();
        if (id.empty()) {
            return Error(ErrorCode::INVALID_ARGUMENT, "Provider reported an empty id");
        }
        if (registry->index_.count(id)) {
            return Error(ErrorCode::INVALID_ARGUMENT, "Duplicate provider id: " + id);
        }

        registrations.push_back({id, provider->base_cost_per_token()});
        registry->index_[id] = registry->entries_.size();

        Entry entry;
        entry.breaker = std::make_unique<CircuitBreaker>(id, breaker_config);
        entry.provider = std::move(provider);
        registry->entries_.push_back(std::move(entry));
    }

    registry->metrics_ = std::make_unique<ProviderMetricsStore>(registrations);
    for (auto& entry : registry->entries_) {
        entry.metrics = registry->metrics_->get(entry.breaker->provider());
    }

    return std::move(registry);
}

ProviderRegistry::Entry* ProviderRegistry::find(const ProviderId& provider) {
    auto it = index_.find(provider);
    return it == index_.end() ? nullptr : &entries_[it->second];
}

const ProviderRegistry::Entry* ProviderRegistry::find(const ProviderId& provider) const {
    auto it = index_.find(provider);
    return it == index_.end() ? nullptr : &entries_[it->second];
}

RoutingSnapshot ProviderRegistry::snapshot() {
    RoutingSnapshot snap;
    snap.taken_at_unix_ms = unix_now_ms();
    snap.providers.reserve(entries_.size());

    for (auto& entry : entries_) {
        ProviderSnapshot provider;
        provider.eligible = entry.breaker->is_eligible();
        provider.breaker_state = entry.breaker->state();
        provider.metrics = entry.metrics->snapshot();
        snap.providers.push_back(std::move(provider));
    }

    return snap;
}

}  // namespace relay
