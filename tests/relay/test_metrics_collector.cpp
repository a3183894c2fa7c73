#include <gtest/gtest.h>
#include <relay/metrics_collector.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <numeric>
#include <random>
#include <thread>
#include <vector>

using namespace relay;

class MetricsCollectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        collector_ = std::make_unique<MetricsCollector>(10000, std::vector<ProviderId>{"openai", "claude"});
    }

    std::unique_ptr<MetricsCollector> collector_;
};

TEST_F(MetricsCollectorTest, EmptySnapshot) {
    auto snap = collector_->snapshot();
    EXPECT_EQ(snap.total_requests, 0u);
    EXPECT_DOUBLE_EQ(snap.average_latency_ms, 0.0);
    EXPECT_DOUBLE_EQ(snap.p99_latency_ms, 0.0);
    EXPECT_EQ(snap.provider_distribution.size(), 2u);
    EXPECT_EQ(snap.provider_distribution["openai"], 0u);
}

TEST_F(MetricsCollectorTest, P99OverTenThousandSamples) {
    std::vector<uint64_t> samples(10000);
    std::iota(samples.begin(), samples.end(), 1);  // 1..10000 ms
    std::mt19937 rng(42);
    std::shuffle(samples.begin(), samples.end(), rng);

    for (uint64_t s : samples) {
        collector_->record_latency(s);
    }

    auto stats = collector_->latency_stats();
    EXPECT_EQ(stats.samples, 10000u);
    // Sorted index floor(10000 * 0.99) = 9900 holds 9901
    EXPECT_NEAR(stats.p99_ms, 9900.0, 1.0);
    EXPECT_NEAR(stats.p95_ms, 9500.0, 1.0);
    EXPECT_NEAR(stats.mean_ms, 5000.5, 1e-9);
}

TEST_F(MetricsCollectorTest, PercentileOfSmallSets) {
    EXPECT_DOUBLE_EQ(MetricsCollector::percentile({}, 0.99), 0.0);
    EXPECT_DOUBLE_EQ(MetricsCollector::percentile({7}, 0.99), 7.0);
    EXPECT_DOUBLE_EQ(MetricsCollector::percentile({1, 2, 3, 4}, 0.5), 3.0);
    EXPECT_DOUBLE_EQ(MetricsCollector::percentile({1, 2, 3, 4}, 1.0), 4.0);
}

TEST_F(MetricsCollectorTest, WindowDropsOldestSamples) {
    MetricsCollector small(3, {});
    small.record_latency(1000);
    small.record_latency(1);
    small.record_latency(2);
    small.record_latency(3);

    auto stats = small.latency_stats();
    EXPECT_EQ(stats.samples, 3u);
    EXPECT_DOUBLE_EQ(stats.mean_ms, 2.0);
}

TEST_F(MetricsCollectorTest, CountsOutcomes) {
    collector_->record_success("openai", 120, 0.002);
    collector_->record_success("openai", 80, 0.003);
    collector_->record_success("claude", 100, 0.001);
    collector_->record_cache_hit(0.0001);
    collector_->record_failure();

    auto snap = collector_->snapshot();
    EXPECT_EQ(snap.total_requests, 5u);
    EXPECT_EQ(snap.successful_requests, 4u);
    EXPECT_EQ(snap.failed_requests, 1u);
    EXPECT_EQ(snap.cache_hits, 1u);
    EXPECT_EQ(snap.provider_distribution["openai"], 2u);
    EXPECT_EQ(snap.provider_distribution["claude"], 1u);
    EXPECT_NEAR(snap.total_cost_usd, 0.0061, 1e-9);
    EXPECT_DOUBLE_EQ(snap.average_latency_ms, 100.0);
    EXPECT_GT(snap.uptime_seconds, 0.0);
    EXPECT_GT(snap.requests_per_second, 0.0);
}

TEST_F(MetricsCollectorTest, UnknownProviderStillCountsTotals) {
    collector_->record_success("gemini", 50, 0.0);

    auto snap = collector_->snapshot();
    EXPECT_EQ(snap.successful_requests, 1u);
    EXPECT_EQ(snap.provider_distribution.count("gemini"), 0u);
}

TEST_F(MetricsCollectorTest, ConcurrentRecording) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this] {
            for (int i = 0; i < 1000; ++i) {
                collector_->record_success("openai", 10, 0.000001);
            }
        });
    }
    for (auto& t : threads) t.join();

    auto snap = collector_->snapshot();
    EXPECT_EQ(snap.total_requests, 8000u);
    EXPECT_EQ(snap.provider_distribution["openai"], 8000u);
    EXPECT_NEAR(snap.total_cost_usd, 0.008, 1e-9);
}

TEST_F(MetricsCollectorTest, SnapshotToJson) {
    collector_->record_success("openai", 120, 0.002);

    auto snap = collector_->snapshot();
    snap.circuit_breaker_states["openai"] = "closed";
    ProviderHealth health;
    health.provider = "openai";
    health.breaker_state = "closed";
    health.success_rate = 0.99;
    snap.provider_health.push_back(health);

    auto j = nlohmann::json::parse(snap.to_json());
    EXPECT_EQ(j["total_requests"].get<uint64_t>(), 1u);
    EXPECT_EQ(j["provider_distribution"]["openai"].get<uint64_t>(), 1u);
    EXPECT_EQ(j["circuit_breaker_states"]["openai"].get<std::string>(), "closed");
    ASSERT_EQ(j["provider_health"].size(), 1u);
    EXPECT_EQ(j["provider_health"][0]["provider"].get<std::string>(), "openai");
}
