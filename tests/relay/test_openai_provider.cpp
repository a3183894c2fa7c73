#include <gtest/gtest.h>
#include <relay/providers/openai_provider.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>

using namespace relay;
using namespace relay::providers;

class OpenAIProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.id = "openai";
        config_.model = "gpt-4o-mini";
        config_.cost_per_token = 0.00003;
    }

    HttpProviderConfig config_;
};

TEST_F(OpenAIProviderTest, RequestBody) {
    Request req;
    req.prompt = "What is the capital of France?";
    req.max_tokens = 64;
    req.temperature = 0.2;

    auto body = nlohmann::json::parse(OpenAICompatibleProvider::build_request_body(config_, req));
    EXPECT_EQ(body["model"].get<std::string>(), "gpt-4o-mini");
    ASSERT_EQ(body["messages"].size(), 1u);
    EXPECT_EQ(body["messages"][0]["role"].get<std::string>(), "user");
    EXPECT_EQ(body["messages"][0]["content"].get<std::string>(), req.prompt);
    EXPECT_EQ(body["max_tokens"].get<uint32_t>(), 64u);
    EXPECT_DOUBLE_EQ(body["temperature"].get<double>(), 0.2);
}

TEST_F(OpenAIProviderTest, RequestBodyDefaults) {
    Request req;
    req.prompt = "hi";

    auto body = nlohmann::json::parse(OpenAICompatibleProvider::build_request_body(config_, req));
    EXPECT_EQ(body["max_tokens"].get<uint32_t>(), DEFAULT_MAX_TOKENS);
    EXPECT_FALSE(body.contains("temperature"));
}

TEST_F(OpenAIProviderTest, ParseSuccess) {
    std::string body = R"({
        "id": "chatcmpl-1",
        "model": "gpt-4o-mini-2024-07-18",
        "choices": [{"index": 0, "message": {"role": "assistant", "content": "Paris."}}],
        "usage": {"prompt_tokens": 12, "completion_tokens": 3, "total_tokens": 15}
    })";

    auto result = OpenAICompatibleProvider::parse_response(config_, 200, body);
    ASSERT_TRUE(result.ok()) << result.error().to_string();
    EXPECT_EQ(result->content, "Paris.");
    EXPECT_EQ(result->provider, "openai");
    EXPECT_EQ(result->model, "gpt-4o-mini-2024-07-18");
    EXPECT_EQ(result->tokens_used, 15u);
    EXPECT_NEAR(result->cost_usd, 15 * 0.00003, 1e-12);
}

TEST_F(OpenAIProviderTest, ParseWithoutUsage) {
    std::string body = R"({"choices": [{"message": {"content": "ok"}}]})";

    auto result = OpenAICompatibleProvider::parse_response(config_, 200, body);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->model, "gpt-4o-mini");
    EXPECT_EQ(result->tokens_used, 0u);
    EXPECT_DOUBLE_EQ(result->cost_usd, 0.0);
}

TEST_F(OpenAIProviderTest, StatusMapping) {
    EXPECT_EQ(OpenAICompatibleProvider::error_code_for_status(429), ErrorCode::RATE_LIMITED);
    EXPECT_EQ(OpenAICompatibleProvider::error_code_for_status(401), ErrorCode::AUTH_ERROR);
    EXPECT_EQ(OpenAICompatibleProvider::error_code_for_status(403), ErrorCode::AUTH_ERROR);
    EXPECT_EQ(OpenAICompatibleProvider::error_code_for_status(408), ErrorCode::TIMEOUT);
    EXPECT_EQ(OpenAICompatibleProvider::error_code_for_status(400), ErrorCode::INVALID_REQUEST);
    EXPECT_EQ(OpenAICompatibleProvider::error_code_for_status(500), ErrorCode::PROVIDER_ERROR);
    EXPECT_EQ(OpenAICompatibleProvider::error_code_for_status(503), ErrorCode::PROVIDER_ERROR);
}

TEST_F(OpenAIProviderTest, ErrorBodyMessageIsKept) {
    std::string body = R"({"error": {"message": "Rate limit reached", "type": "requests"}})";

    auto result = OpenAICompatibleProvider::parse_response(config_, 429, body);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::RATE_LIMITED);
    EXPECT_EQ(result.error().message(), "HTTP 429: Rate limit reached");

    auto plain = OpenAICompatibleProvider::parse_response(config_, 502, "<html>bad gateway</html>");
    ASSERT_FALSE(plain.ok());
    EXPECT_EQ(plain.error_code(), ErrorCode::PROVIDER_ERROR);
    EXPECT_EQ(plain.error().message(), "HTTP 502");
}

TEST_F(OpenAIProviderTest, MalformedSuccessBody) {
    auto garbage = OpenAICompatibleProvider::parse_response(config_, 200, "not json");
    ASSERT_FALSE(garbage.ok());
    EXPECT_EQ(garbage.error_code(), ErrorCode::PROVIDER_ERROR);

    auto empty = OpenAICompatibleProvider::parse_response(config_, 200, R"({"choices": []})");
    ASSERT_FALSE(empty.ok());
    EXPECT_EQ(empty.error_code(), ErrorCode::PROVIDER_ERROR);

    auto missing = OpenAICompatibleProvider::parse_response(config_, 200, R"({"choices": [{}]})");
    EXPECT_EQ(missing.error_code(), ErrorCode::PROVIDER_ERROR);
}

TEST_F(OpenAIProviderTest, ProvidersFromJson) {
    setenv("RELAY_TEST_KEY", "sk-test", 1);

    auto configs = http_providers_from_json(R"({"providers": [
        {"id": "openai", "model": "gpt-4o", "model_size": "large",
         "cost_per_token": 0.00005, "api_key_env": "RELAY_TEST_KEY"},
        {"id": "local", "base_url": "http://localhost:8080/v1", "model_size": "small",
         "timeout_ms": 5000}
    ]})");
    ASSERT_TRUE(configs.ok()) << configs.error().to_string();
    ASSERT_EQ(configs->size(), 2u);

    const auto& openai = (*configs)[0];
    EXPECT_EQ(openai.id, "openai");
    EXPECT_EQ(openai.model, "gpt-4o");
    EXPECT_EQ(openai.model_size, ModelSize::LARGE);
    EXPECT_DOUBLE_EQ(openai.cost_per_token, 0.00005);
    EXPECT_EQ(openai.api_key, "sk-test");
    EXPECT_EQ(openai.base_url, "https://api.openai.com/v1");

    const auto& local = (*configs)[1];
    EXPECT_EQ(local.base_url, "http://localhost:8080/v1");
    EXPECT_EQ(local.model_size, ModelSize::SMALL);
    EXPECT_EQ(local.timeout_ms, 5000);
    EXPECT_TRUE(local.api_key.empty());

    unsetenv("RELAY_TEST_KEY");
}

TEST_F(OpenAIProviderTest, ProvidersFromJsonErrors) {
    EXPECT_FALSE(http_providers_from_json("{}").ok());
    EXPECT_FALSE(http_providers_from_json(R"({"providers": [{"model": "x"}]})").ok());
    EXPECT_FALSE(http_providers_from_json(
        R"({"providers": [{"id": "a", "model_size": "huge"}]})").ok());
}

TEST_F(OpenAIProviderTest, AdapterReportsConfiguredModel) {
    config_.model_size = ModelSize::SMALL;
    OpenAICompatibleProvider provider(config_);

    EXPECT_EQ(provider.provider_id(), "openai");
    EXPECT_DOUBLE_EQ(provider.base_cost_per_token(), 0.00003);
    auto models = provider.supported_models();
    ASSERT_EQ(models.size(), 1u);
    EXPECT_EQ(models[0].name, "gpt-4o-mini");
    EXPECT_EQ(models[0].size, ModelSize::SMALL);
}
