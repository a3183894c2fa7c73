#include <gtest/gtest.h>
#include <relay/config.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

using namespace relay;

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "relay_config_test";
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    fs::path write_file(const std::string& name, const std::string& content) {
        fs::path path = test_dir_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    fs::path test_dir_;
};

TEST_F(ConfigTest, EmptyObjectKeepsDefaults) {
    auto config = config_from_json("{}");
    ASSERT_TRUE(config.ok()) << config.error().to_string();

    EXPECT_DOUBLE_EQ(config->routing.cost, 0.3);
    EXPECT_DOUBLE_EQ(config->routing.latency, 0.4);
    EXPECT_EQ(config->circuit_breaker.failure_threshold, 5u);
    EXPECT_EQ(config->circuit_breaker.timeout_ms, 60000u);
    EXPECT_EQ(config->retry.max_retries, 3u);
    EXPECT_EQ(config->cache.ttl_seconds, 300u);
    EXPECT_DOUBLE_EQ(config->cache.hit_cost_reduction, 0.05);
    EXPECT_FALSE(config->budget.hourly_budget_usd.has_value());
    EXPECT_EQ(config->admission.policy, BackpressurePolicy::QUEUE);
}

TEST_F(ConfigTest, PartialOverride) {
    auto config = config_from_json(R"({
        "default_timeout_ms": 5000,
        "routing": {"cost": 0.7, "latency": 0.1},
        "circuit_breaker": {"failure_threshold": 2},
        "budget": {"hourly_budget_usd": 25.5},
        "admission": {"policy": "reject", "max_concurrent_requests": 8}
    })");
    ASSERT_TRUE(config.ok()) << config.error().to_string();

    EXPECT_EQ(config->default_timeout_ms, 5000u);
    EXPECT_DOUBLE_EQ(config->routing.cost, 0.7);
    EXPECT_DOUBLE_EQ(config->routing.latency, 0.1);
    EXPECT_DOUBLE_EQ(config->routing.quality, 0.2);
    EXPECT_EQ(config->circuit_breaker.failure_threshold, 2u);
    EXPECT_EQ(config->circuit_breaker.success_threshold, 3u);
    ASSERT_TRUE(config->budget.hourly_budget_usd.has_value());
    EXPECT_DOUBLE_EQ(*config->budget.hourly_budget_usd, 25.5);
    EXPECT_EQ(config->admission.policy, BackpressurePolicy::REJECT);
    EXPECT_EQ(config->admission.max_concurrent_requests, 8u);
}

TEST_F(ConfigTest, MalformedJson) {
    auto config = config_from_json("{ not json");
    ASSERT_FALSE(config.ok());
    EXPECT_EQ(config.error_code(), ErrorCode::INVALID_ARGUMENT);

    EXPECT_FALSE(config_from_json("[1, 2]").ok());
    EXPECT_FALSE(config_from_json(R"({"retry": 3})").ok());
    EXPECT_FALSE(config_from_json(R"({"retry": {"max_retries": "many"}})").ok());
}

TEST_F(ConfigTest, UnknownPolicy) {
    auto config = config_from_json(R"({"admission": {"policy": "drop"}})");
    ASSERT_FALSE(config.ok());
    EXPECT_NE(config.error().message().find("drop"), std::string::npos);
}

TEST_F(ConfigTest, ValidationFailures) {
    EXPECT_FALSE(config_from_json(R"({"routing": {"cost": -0.1}})").ok());
    EXPECT_FALSE(config_from_json(R"({"circuit_breaker": {"success_threshold": 0}})").ok());
    EXPECT_FALSE(config_from_json(R"({"retry": {"backoff_multiplier": 0.5}})").ok());
    EXPECT_FALSE(config_from_json(R"({"retry": {"base_delay_ms": 200, "max_delay_ms": 100}})").ok());
    EXPECT_FALSE(config_from_json(R"({"cache": {"hit_cost_reduction": 1.5}})").ok());
    EXPECT_FALSE(config_from_json(R"({"budget": {"hourly_budget_usd": -1}})").ok());
    EXPECT_FALSE(config_from_json(R"({"admission": {"max_concurrent_requests": 0}})").ok());

    // A disabled cache does not need a capacity
    EXPECT_TRUE(config_from_json(R"({"cache": {"enabled": false, "max_entries": 0}})").ok());
}

TEST_F(ConfigTest, ValidateDefaults) {
    EXPECT_TRUE(validate_config(LoadBalancerConfig{}).ok());
}

TEST_F(ConfigTest, ToJsonRoundTrips) {
    LoadBalancerConfig original;
    original.routing.cost = 0.5;
    original.routing.latency = 0.2;
    original.retry.jitter = false;
    original.budget.hourly_budget_usd = 12.0;
    original.admission.policy = BackpressurePolicy::REJECT;
    original.cache.shards = 4;

    auto parsed = config_from_json(config_to_json(original));
    ASSERT_TRUE(parsed.ok()) << parsed.error().to_string();

    EXPECT_DOUBLE_EQ(parsed->routing.cost, 0.5);
    EXPECT_DOUBLE_EQ(parsed->routing.latency, 0.2);
    EXPECT_FALSE(parsed->retry.jitter);
    EXPECT_DOUBLE_EQ(*parsed->budget.hourly_budget_usd, 12.0);
    EXPECT_EQ(parsed->admission.policy, BackpressurePolicy::REJECT);
    EXPECT_EQ(parsed->cache.shards, 4u);
}

TEST_F(ConfigTest, UnlimitedBudgetSerializesAsNull) {
    auto j = nlohmann::json::parse(config_to_json(LoadBalancerConfig{}));
    EXPECT_TRUE(j["budget"]["hourly_budget_usd"].is_null());
    EXPECT_EQ(j["admission"]["policy"].get<std::string>(), "queue");
}

TEST_F(ConfigTest, LoadFromFile) {
    auto path = write_file("relay.json", R"({"retry": {"max_retries": 1}})");

    auto config = load_config(path);
    ASSERT_TRUE(config.ok()) << config.error().to_string();
    EXPECT_EQ(config->retry.max_retries, 1u);
}

TEST_F(ConfigTest, LoadMissingFile) {
    auto config = load_config(test_dir_ / "missing.json");
    ASSERT_FALSE(config.ok());
    EXPECT_EQ(config.error_code(), ErrorCode::IO_ERROR);
}
