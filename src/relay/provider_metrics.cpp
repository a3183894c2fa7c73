#include <relay/provider_metrics.hpp>

#include <algorithm>
#include <chrono>

namespace relay {

namespace {

// Exponential moving average on an atomic double
void ewma_update(std::atomic<double>& value, double sample, double alpha) {
    double current = value.load(std::memory_order_relaxed);
    double next;
    do {
        next = alpha * sample + (1.0 - alpha) * current;
    } while (!value.compare_exchange_weak(current, next, std::memory_order_relaxed));
}

}  // namespace

int64_t unix_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// ============================================================================
// ProviderMetrics
// ============================================================================

ProviderMetrics::ProviderMetrics(ProviderId provider, double cost_per_token)
    : provider_(std::move(provider))
    , cost_per_token_(cost_per_token)
    , last_success_unix_ms_(unix_now_ms())
{}

void ProviderMetrics::record_success(uint64_t latency_ms, std::optional<double> quality_score) {
    ewma_update(latency_ms_, static_cast<double>(latency_ms), LATENCY_ALPHA);
    ewma_update(success_rate_, 1.0, SUCCESS_ALPHA);
    if (quality_score) {
        ewma_update(quality_score_, std::clamp(*quality_score, 0.0, 1.0), QUALITY_ALPHA);
    }
    last_success_unix_ms_.store(unix_now_ms(), std::memory_order_relaxed);
    requests_.fetch_add(1, std::memory_order_relaxed);
}

void ProviderMetrics::record_failure() {
    ewma_update(success_rate_, 0.0, SUCCESS_ALPHA);
    requests_.fetch_add(1, std::memory_order_relaxed);
    errors_.fetch_add(1, std::memory_order_relaxed);
}

void ProviderMetrics::set_cost_per_token(double cost_per_token) {
    cost_per_token_.store(std::max(0.0, cost_per_token), std::memory_order_relaxed);
}

void ProviderMetrics::set_quality_score(double quality_score) {
    quality_score_.store(std::clamp(quality_score, 0.0, 1.0), std::memory_order_relaxed);
}

ProviderMetricsSnapshot ProviderMetrics::snapshot() const {
    ProviderMetricsSnapshot snap;
    snap.provider = provider_;
    snap.cost_per_token = cost_per_token_.load(std::memory_order_relaxed);
    snap.latency_ms = latency_ms_.load(std::memory_order_relaxed);
    snap.quality_score = quality_score_.load(std::memory_order_relaxed);
    snap.success_rate = success_rate_.load(std::memory_order_relaxed);
    snap.last_success_unix_ms = last_success_unix_ms_.load(std::memory_order_relaxed);
    snap.requests = requests_.load(std::memory_order_relaxed);
    snap.errors = errors_.load(std::memory_order_relaxed);
    return snap;
}

// ============================================================================
// ProviderMetricsStore
// ============================================================================

ProviderMetricsStore::ProviderMetricsStore(const std::vector<Registration>& providers) {
    ordered_.reserve(providers.size());
    for (const auto& reg : providers) {
        if (by_id_.count(reg.provider)) {
            continue;
        }
        ordered_.push_back(std::make_unique<ProviderMetrics>(reg.provider, reg.cost_per_token));
        by_id_[reg.provider] = ordered_.back().get();
    }
}

ProviderMetrics* ProviderMetricsStore::get(const ProviderId& provider) {
    auto it = by_id_.find(provider);
    return it == by_id_.end() ? nullptr : it->second;
}

const ProviderMetrics* ProviderMetricsStore::get(const ProviderId& provider) const {
    auto it = by_id_.find(provider);
    return it == by_id_.end() ? nullptr : it->second;
}

std::vector<ProviderMetricsSnapshot> ProviderMetricsStore::snapshot_all() const {
    std::vector<ProviderMetricsSnapshot> result;
    result.reserve(ordered_.size());
    for (const auto& metrics : ordered_) {
        result.push_back(metrics->snapshot());
    }
    return result;
}

}  // namespace relay
