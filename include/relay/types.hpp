#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace relay {

// Provider identifiers are the names adapters report, e.g. "openai".
using ProviderId = std::string;

// ============================================================================
// Request / Response
// ============================================================================

enum class ModelSize {
    SMALL,   // Fast, cheap models
    MEDIUM,  // Balanced models
    LARGE    // Premium models
};

enum class Priority {
    LOW = 1,
    NORMAL = 2,
    HIGH = 3,
    CRITICAL = 4
};

const char* model_size_name(ModelSize size);
const char* priority_name(Priority priority);

struct Request {
    std::string id;
    std::string prompt;
    std::optional<uint32_t> max_tokens;
    std::optional<double> temperature;
    std::optional<ModelSize> model_preference;
    Priority priority = Priority::NORMAL;
    uint64_t timeout_ms = 0;  // 0 = use LoadBalancerConfig::default_timeout_ms
};

struct Response {
    std::string id;           // Matches Request::id
    std::string content;
    ProviderId provider;
    std::string model;
    uint32_t tokens_used = 0;
    uint64_t latency_ms = 0;
    double cost_usd = 0.0;
    std::optional<double> quality_score;
    bool cached = false;      // Served from the request cache
};

struct ModelInfo {
    std::string name;
    ModelSize size = ModelSize::MEDIUM;
};

// Default output budget when a request does not specify max_tokens
constexpr uint32_t DEFAULT_MAX_TOKENS = 1000;

}  // namespace relay
