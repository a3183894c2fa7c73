#include <relay/routing_engine.hpp>
#include <relay/util/logger.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace relay {

RoutingEngine::RoutingEngine(RoutingWeights weights)
    : weights_(weights)
{
    if (std::fabs(weights_.sum() - 1.0) > 1e-6) {
        std::ostringstream ss;
        ss << "routing weights sum to " << weights_.sum() << ", expected 1.0";
        logger()->warning(ss.str());
    }
}

double RoutingEngine::size_multiplier(const std::optional<ModelSize>& size) {
    if (!size) {
        return 1.2;
    }
    switch (*size) {
        case ModelSize::SMALL: return 1.0;
        case ModelSize::MEDIUM: return 1.5;
        case ModelSize::LARGE: return 2.0;
    }
    return 1.2;
}

double RoutingEngine::estimate_cost(const Request& request, double cost_per_token) {
    uint32_t max_tokens = request.max_tokens.value_or(DEFAULT_MAX_TOKENS);
    return cost_per_token * size_multiplier(request.model_preference) *
           static_cast<double>(max_tokens);
}

ProviderScore RoutingEngine::score(const Request& request,
                                   const ProviderSnapshot& provider,
                                   int64_t now_unix_ms) const {
    const auto& m = provider.metrics;

    ProviderScore result;
    result.provider = m.provider;

    // Cheaper is better, normalized against a one-cent reference
    double estimated_cost = estimate_cost(request, m.cost_per_token);
    result.cost = 1.0 / (1.0 + estimated_cost / REFERENCE_COST_USD);

    // Faster is better, relative to the priority's latency target
    double target = request.priority >= Priority::HIGH ? HIGH_PRIORITY_TARGET_MS : NORMAL_TARGET_MS;
    double latency = std::max(0.0, m.latency_ms);
    result.latency = std::min(1.0, target / (target + latency));

    result.quality = std::clamp(m.quality_score, 0.0, 1.0);

    // Success history decays when the provider has not succeeded recently
    double since_success_s = std::max<int64_t>(0, now_unix_ms - m.last_success_unix_ms) / 1000.0;
    double freshness = std::exp(-since_success_s / FRESHNESS_DECAY_SECONDS);
    result.reliability = std::clamp(m.success_rate, 0.0, 1.0) * freshness;

    result.overall = weights_.cost * result.cost +
                     weights_.latency * result.latency +
                     weights_.quality * result.quality +
                     weights_.reliability * result.reliability;
    return result;
}

std::vector<ProviderScore> RoutingEngine::rank(const Request& request,
                                               const RoutingSnapshot& snapshot) const {
    std::vector<ProviderScore> scores;
    scores.reserve(snapshot.providers.size());

    for (size_t i = 0; i < snapshot.providers.size(); ++i) {
        const auto& provider = snapshot.providers[i];
        if (!provider.eligible) continue;

        ProviderScore s = score(request, provider, snapshot.taken_at_unix_ms);
        s.registration_index = i;
        scores.push_back(std::move(s));
    }

    std::stable_sort(scores.begin(), scores.end(),
        [](const ProviderScore& a, const ProviderScore& b) {
            return a.overall > b.overall;
        });

    return scores;
}

Result<ProviderId> RoutingEngine::select(const Request& request,
                                         const RoutingSnapshot& snapshot,
                                         const std::unordered_set<ProviderId>& excluded) const {
    const ProviderSnapshot* best = nullptr;
    double best_score = 0.0;

    for (const auto& provider : snapshot.providers) {
        if (!provider.eligible || excluded.count(provider.metrics.provider)) {
            continue;
        }

        double overall = score(request, provider, snapshot.taken_at_unix_ms).overall;
        // Strictly greater: the earlier registration wins a tie
        if (!best || overall > best_score) {
            best = &provider;
            best_score = overall;
        }
    }

    if (!best) {
        return Error(ErrorCode::NO_PROVIDERS_AVAILABLE, "No eligible providers");
    }

    return best->metrics.provider;
}

}  // namespace relay
