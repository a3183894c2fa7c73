#pragma once

#include <relay/provider.hpp>

#include <string>
#include <vector>

namespace relay::providers {

struct HttpProviderConfig {
    std::string id = "openai";
    std::string base_url = "https://api.openai.com/v1";
    std::string api_key;
    std::string model = "gpt-4o-mini";
    ModelSize model_size = ModelSize::MEDIUM;
    double cost_per_token = 0.00003;  // $0.03 per 1K tokens
    long timeout_ms = 30000;
};

/**
 * Provider adapter for OpenAI-compatible chat completion endpoints
 * (POST {base_url}/chat/completions, GET {base_url}/models).
 *
 * Each call uses its own CURL easy handle so the adapter can be shared
 * across dispatching threads.
 */
class OpenAICompatibleProvider : public Provider {
public:
    explicit OpenAICompatibleProvider(HttpProviderConfig config);

    OpenAICompatibleProvider(const OpenAICompatibleProvider&) = delete;
    OpenAICompatibleProvider& operator=(const OpenAICompatibleProvider&) = delete;

    // Provider interface
    ProviderId provider_id() const override { return config_.id; }
    Result<Response> complete(const Request& request) override;
    std::vector<ModelInfo> supported_models() const override;
    double base_cost_per_token() const override { return config_.cost_per_token; }
    bool health_check() override;

    // Wire format, exposed for tests
    static std::string build_request_body(const HttpProviderConfig& config, const Request& request);
    static Result<Response> parse_response(const HttpProviderConfig& config,
                                           long http_status,
                                           const std::string& body);
    static ErrorCode error_code_for_status(long http_status);

    const HttpProviderConfig& config() const { return config_; }

private:
    HttpProviderConfig config_;

    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata);
};

/**
 * Parse a provider list:
 *   {"providers": [{"id": "openai", "base_url": "...", "model": "...",
 *                   "model_size": "medium", "cost_per_token": 0.00003,
 *                   "api_key_env": "OPENAI_API_KEY", "timeout_ms": 30000}]}
 *
 * API keys are read from the named environment variables.
 *
 * @return Configurations, or INVALID_ARGUMENT
 */
Result<std::vector<HttpProviderConfig>> http_providers_from_json(const std::string& json_text);

}  // namespace relay::providers
