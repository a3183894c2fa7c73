#include <relay/providers/openai_provider.hpp>
#include <relay/util/logger.hpp>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <memory>
#include <mutex>

namespace relay::providers {

using json = nlohmann::json;

namespace {

struct ResponseBuffer {
    std::string data;
};

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

CurlHandle make_handle() {
    static std::once_flag curl_init_flag;
    std::call_once(curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
    return CurlHandle(curl_easy_init(), &curl_easy_cleanup);
}

struct HeaderList {
    curl_slist* list = nullptr;
    ~HeaderList() { curl_slist_free_all(list); }
    void add(const std::string& header) { list = curl_slist_append(list, header.c_str()); }
};

Error curl_error(CURLcode res) {
    if (res == CURLE_OPERATION_TIMEDOUT) {
        return Error(ErrorCode::TIMEOUT, "Request timed out");
    }
    return Error(ErrorCode::NETWORK_ERROR,
        std::string("Network error: ") + curl_easy_strerror(res));
}

std::optional<ModelSize> parse_model_size(const std::string& name) {
    if (name == "small") return ModelSize::SMALL;
    if (name == "medium") return ModelSize::MEDIUM;
    if (name == "large") return ModelSize::LARGE;
    return std::nullopt;
}

}  // namespace

OpenAICompatibleProvider::OpenAICompatibleProvider(HttpProviderConfig config)
    : config_(std::move(config)) {}

size_t OpenAICompatibleProvider::write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<ResponseBuffer*>(userdata);
    size_t total_size = size * nmemb;
    buffer->data.append(ptr, total_size);
    return total_size;
}

std::vector<ModelInfo> OpenAICompatibleProvider::supported_models() const {
    return {ModelInfo{config_.model, config_.model_size}};
}

// ============================================================================
// Wire Format
// ============================================================================

std::string OpenAICompatibleProvider::build_request_body(const HttpProviderConfig& config,
                                                         const Request& request) {
    json body;
    body["model"] = config.model;
    body["messages"] = json::array({
        {{"role", "user"}, {"content", request.prompt}}
    });
    body["max_tokens"] = request.max_tokens.value_or(DEFAULT_MAX_TOKENS);
    if (request.temperature) {
        body["temperature"] = *request.temperature;
    }
    return body.dump();
}

ErrorCode OpenAICompatibleProvider::error_code_for_status(long http_status) {
    if (http_status == 429) return ErrorCode::RATE_LIMITED;
    if (http_status == 401 || http_status == 403) return ErrorCode::AUTH_ERROR;
    if (http_status == 408) return ErrorCode::TIMEOUT;
    if (http_status >= 500) return ErrorCode::PROVIDER_ERROR;
    if (http_status >= 400) return ErrorCode::INVALID_REQUEST;
    return ErrorCode::PROVIDER_ERROR;
}

Result<Response> OpenAICompatibleProvider::parse_response(const HttpProviderConfig& config,
                                                          long http_status,
                                                          const std::string& body) {
    if (http_status != 200) {
        std::string message = "HTTP " + std::to_string(http_status);
        // OpenAI-style error bodies: {"error": {"message": "..."}}
        auto j = json::parse(body, nullptr, false);
        if (!j.is_discarded() && j.is_object() && j.contains("error")) {
            const auto& err = j["error"];
            if (err.is_object() && err.contains("message") && err["message"].is_string()) {
                message += ": " + err["message"].get<std::string>();
            } else if (err.is_string()) {
                message += ": " + err.get<std::string>();
            }
        }
        return Error(error_code_for_status(http_status), message);
    }

    try {
        auto j = json::parse(body);

        const auto& choices = j.at("choices");
        if (!choices.is_array() || choices.empty()) {
            return Error(ErrorCode::PROVIDER_ERROR, "Response has no choices");
        }

        Response response;
        response.content = choices[0].at("message").at("content").get<std::string>();
        response.provider = config.id;
        response.model = j.value("model", config.model);

        if (j.contains("usage")) {
            const auto& usage = j["usage"];
            response.tokens_used = usage.value("total_tokens",
                usage.value("prompt_tokens", 0u) + usage.value("completion_tokens", 0u));
        }
        response.cost_usd = static_cast<double>(response.tokens_used) * config.cost_per_token;

        return response;
    } catch (const json::exception& e) {
        return Error(ErrorCode::PROVIDER_ERROR,
            std::string("Failed to parse response: ") + e.what());
    }
}

// ============================================================================
// Transport
// ============================================================================

Result<Response> OpenAICompatibleProvider::complete(const Request& request) {
    CurlHandle curl = make_handle();
    if (!curl) {
        return Error(ErrorCode::INTERNAL_ERROR, "Failed to initialize CURL");
    }

    std::string request_body = build_request_body(config_, request);
    std::string url = config_.base_url + "/chat/completions";

    HeaderList headers;
    headers.add("Content-Type: application/json");
    if (!config_.api_key.empty()) {
        headers.add("Authorization: Bearer " + config_.api_key);
    }

    long timeout_ms = config_.timeout_ms;
    if (request.timeout_ms > 0) {
        timeout_ms = static_cast<long>(request.timeout_ms);
    }

    ResponseBuffer response;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.list);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request_body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return curl_error(res);
    }

    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);

    return parse_response(config_, http_code, response.data);
}

bool OpenAICompatibleProvider::health_check() {
    CurlHandle curl = make_handle();
    if (!curl) {
        return false;
    }

    std::string url = config_.base_url + "/models";

    HeaderList headers;
    if (!config_.api_key.empty()) {
        headers.add("Authorization: Bearer " + config_.api_key);
    }

    ResponseBuffer response;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.list);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, 5000L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        logger()->debug("health check for " + config_.id + " failed: " + curl_easy_strerror(res));
        return false;
    }

    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
    return http_code == 200;
}

// ============================================================================
// Configuration
// ============================================================================

Result<std::vector<HttpProviderConfig>> http_providers_from_json(const std::string& json_text) {
    std::vector<HttpProviderConfig> configs;

    try {
        auto root = json::parse(json_text);
        const auto& list = root.at("providers");
        if (!list.is_array()) {
            return Error(ErrorCode::INVALID_ARGUMENT, "'providers' must be an array");
        }

        for (const auto& item : list) {
            HttpProviderConfig config;
            config.id = item.at("id").get<std::string>();
            config.base_url = item.value("base_url", config.base_url);
            config.model = item.value("model", config.model);
            config.cost_per_token = item.value("cost_per_token", config.cost_per_token);
            config.timeout_ms = item.value("timeout_ms", config.timeout_ms);

            if (item.contains("model_size")) {
                auto size = parse_model_size(item["model_size"].get<std::string>());
                if (!size) {
                    return Error(ErrorCode::INVALID_ARGUMENT,
                        "Unknown model_size for provider " + config.id);
                }
                config.model_size = *size;
            }

            if (item.contains("api_key_env")) {
                std::string var = item["api_key_env"].get<std::string>();
                if (const char* key = std::getenv(var.c_str())) {
                    config.api_key = key;
                } else {
                    logger()->warning("environment variable " + var + " for provider " +
                                      config.id + " is not set");
                }
            }

            configs.push_back(std::move(config));
        }
    } catch (const json::exception& e) {
        return Error(ErrorCode::INVALID_ARGUMENT,
            std::string("Invalid provider list: ") + e.what());
    }

    return configs;
}

}  // namespace relay::providers
