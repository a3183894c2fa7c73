#include <relay/metrics_collector.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace relay {

using json = nlohmann::json;

// ============================================================================
// MetricsSnapshot
// ============================================================================

std::string MetricsSnapshot::to_json(int indent) const {
    json j;
    j["total_requests"] = total_requests;
    j["successful_requests"] = successful_requests;
    j["failed_requests"] = failed_requests;
    j["cache_hits"] = cache_hits;
    j["average_latency_ms"] = average_latency_ms;
    j["p95_latency_ms"] = p95_latency_ms;
    j["p99_latency_ms"] = p99_latency_ms;
    j["total_cost_usd"] = total_cost_usd;
    j["requests_per_second"] = requests_per_second;
    j["uptime_seconds"] = uptime_seconds;
    j["provider_distribution"] = provider_distribution;
    j["circuit_breaker_states"] = circuit_breaker_states;

    json health = json::array();
    for (const auto& h : provider_health) {
        health.push_back({
            {"provider", h.provider},
            {"breaker_state", h.breaker_state},
            {"success_rate", h.success_rate},
            {"latency_ms", h.latency_ms},
            {"quality_score", h.quality_score},
            {"cost_per_token", h.cost_per_token},
            {"requests", h.requests},
            {"errors", h.errors},
            {"last_success_unix_ms", h.last_success_unix_ms},
            {"breaker_transitions", h.breaker_transitions}
        });
    }
    j["provider_health"] = health;

    return j.dump(indent);
}

// ============================================================================
// MetricsCollector
// ============================================================================

MetricsCollector::MetricsCollector(size_t window_size, const std::vector<ProviderId>& providers)
    : window_size_(std::max<size_t>(1, window_size))
    , started_at_(Clock::now())
{
    for (const auto& provider : providers) {
        if (per_provider_.count(provider)) continue;
        provider_order_.push_back(provider);
        per_provider_[provider] = std::make_unique<std::atomic<uint64_t>>(0);
    }
}

void MetricsCollector::add_cost(double cost_usd) {
    if (cost_usd <= 0.0) return;
    auto micros = static_cast<uint64_t>(std::llround(cost_usd * 1e6));
    cost_micros_.fetch_add(micros, std::memory_order_relaxed);
}

void MetricsCollector::record_success(const ProviderId& provider, uint64_t latency_ms, double cost_usd) {
    total_.fetch_add(1, std::memory_order_relaxed);
    successes_.fetch_add(1, std::memory_order_relaxed);
    add_cost(cost_usd);

    auto it = per_provider_.find(provider);
    if (it != per_provider_.end()) {
        it->second->fetch_add(1, std::memory_order_relaxed);
    }

    record_latency(latency_ms);
}

void MetricsCollector::record_cache_hit(double cost_usd) {
    total_.fetch_add(1, std::memory_order_relaxed);
    successes_.fetch_add(1, std::memory_order_relaxed);
    cache_hits_.fetch_add(1, std::memory_order_relaxed);
    add_cost(cost_usd);
}

void MetricsCollector::record_failure() {
    total_.fetch_add(1, std::memory_order_relaxed);
    failures_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsCollector::record_latency(uint64_t latency_ms) {
    std::lock_guard<std::mutex> lock(window_mutex_);
    latencies_.push_back(latency_ms);
    while (latencies_.size() > window_size_) {
        latencies_.pop_front();
    }
}

double MetricsCollector::percentile(const std::vector<uint64_t>& sorted, double q) {
    if (sorted.empty()) {
        return 0.0;
    }
    auto index = static_cast<size_t>(std::floor(static_cast<double>(sorted.size()) * q));
    index = std::min(index, sorted.size() - 1);
    return static_cast<double>(sorted[index]);
}

LatencyStats MetricsCollector::latency_stats() const {
    std::vector<uint64_t> samples;
    {
        std::lock_guard<std::mutex> lock(window_mutex_);
        samples.assign(latencies_.begin(), latencies_.end());
    }

    LatencyStats stats;
    stats.samples = samples.size();
    if (samples.empty()) {
        return stats;
    }

    std::sort(samples.begin(), samples.end());
    double sum = std::accumulate(samples.begin(), samples.end(), 0.0);
    stats.mean_ms = sum / static_cast<double>(samples.size());
    stats.p95_ms = percentile(samples, 0.95);
    stats.p99_ms = percentile(samples, 0.99);
    return stats;
}

MetricsSnapshot MetricsCollector::snapshot() const {
    MetricsSnapshot snap;
    snap.total_requests = total_.load(std::memory_order_relaxed);
    snap.successful_requests = successes_.load(std::memory_order_relaxed);
    snap.failed_requests = failures_.load(std::memory_order_relaxed);
    snap.cache_hits = cache_hits_.load(std::memory_order_relaxed);
    snap.total_cost_usd = static_cast<double>(cost_micros_.load(std::memory_order_relaxed)) / 1e6;

    LatencyStats stats = latency_stats();
    snap.average_latency_ms = stats.mean_ms;
    snap.p95_latency_ms = stats.p95_ms;
    snap.p99_latency_ms = stats.p99_ms;

    snap.uptime_seconds = std::chrono::duration<double>(Clock::now() - started_at_).count();
    if (snap.uptime_seconds > 0.0) {
        snap.requests_per_second = static_cast<double>(snap.total_requests) / snap.uptime_seconds;
    }

    for (const auto& provider : provider_order_) {
        snap.provider_distribution[provider] =
            per_provider_.at(provider)->load(std::memory_order_relaxed);
    }

    return snap;
}

}  // namespace relay
