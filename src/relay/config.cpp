#include <relay/config.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace relay {

using json = nlohmann::json;

namespace {

// Copy a field if present; a type mismatch surfaces as json::type_error
template<typename T>
void read_field(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

const json* section(const json& root, const char* key) {
    auto it = root.find(key);
    if (it == root.end() || it->is_null()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw std::invalid_argument(std::string("section '") + key + "' must be an object");
    }
    return &*it;
}

BackpressurePolicy parse_policy(const std::string& name) {
    if (name == "queue") return BackpressurePolicy::QUEUE;
    if (name == "reject") return BackpressurePolicy::REJECT;
    throw std::invalid_argument("unknown backpressure policy '" + name + "'");
}

const char* policy_name(BackpressurePolicy policy) {
    return policy == BackpressurePolicy::REJECT ? "reject" : "queue";
}

}  // namespace

Result<LoadBalancerConfig> config_from_json(const std::string& json_text) {
    LoadBalancerConfig config;

    try {
        json root = json::parse(json_text);
        if (!root.is_object()) {
            return Error(ErrorCode::INVALID_ARGUMENT, "Configuration must be a JSON object");
        }

        read_field(root, "default_timeout_ms", config.default_timeout_ms);
        read_field(root, "metrics_window_size", config.metrics_window_size);

        if (const json* s = section(root, "routing")) {
            read_field(*s, "cost", config.routing.cost);
            read_field(*s, "latency", config.routing.latency);
            read_field(*s, "quality", config.routing.quality);
            read_field(*s, "reliability", config.routing.reliability);
        }

        if (const json* s = section(root, "circuit_breaker")) {
            read_field(*s, "failure_threshold", config.circuit_breaker.failure_threshold);
            read_field(*s, "success_threshold", config.circuit_breaker.success_threshold);
            read_field(*s, "timeout_ms", config.circuit_breaker.timeout_ms);
            read_field(*s, "half_open_max_calls", config.circuit_breaker.half_open_max_calls);
        }

        if (const json* s = section(root, "retry")) {
            read_field(*s, "max_retries", config.retry.max_retries);
            read_field(*s, "base_delay_ms", config.retry.base_delay_ms);
            read_field(*s, "max_delay_ms", config.retry.max_delay_ms);
            read_field(*s, "backoff_multiplier", config.retry.backoff_multiplier);
            read_field(*s, "jitter", config.retry.jitter);
            read_field(*s, "retry_on_timeout", config.retry.retry_on_timeout);
            read_field(*s, "retry_on_rate_limit", config.retry.retry_on_rate_limit);
        }

        if (const json* s = section(root, "cache")) {
            read_field(*s, "enabled", config.cache.enabled);
            read_field(*s, "ttl_seconds", config.cache.ttl_seconds);
            read_field(*s, "max_entries", config.cache.max_entries);
            read_field(*s, "hit_cost_reduction", config.cache.hit_cost_reduction);
            read_field(*s, "shards", config.cache.shards);
        }

        if (const json* s = section(root, "budget")) {
            auto it = s->find("hourly_budget_usd");
            if (it != s->end() && !it->is_null()) {
                config.budget.hourly_budget_usd = it->get<double>();
            }
        }

        if (const json* s = section(root, "admission")) {
            read_field(*s, "max_concurrent_requests", config.admission.max_concurrent_requests);
            read_field(*s, "queue_timeout_ms", config.admission.queue_timeout_ms);
            auto it = s->find("policy");
            if (it != s->end() && !it->is_null()) {
                config.admission.policy = parse_policy(it->get<std::string>());
            }
        }
    } catch (const json::exception& e) {
        return Error(ErrorCode::INVALID_ARGUMENT, std::string("Invalid configuration: ") + e.what());
    } catch (const std::invalid_argument& e) {
        return Error(ErrorCode::INVALID_ARGUMENT, std::string("Invalid configuration: ") + e.what());
    }

    auto valid = validate_config(config);
    if (!valid) {
        return valid.error();
    }
    return config;
}

Result<LoadBalancerConfig> load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error(ErrorCode::IO_ERROR, "Cannot open config file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return config_from_json(buffer.str());
}

std::string config_to_json(const LoadBalancerConfig& config) {
    json root;
    root["default_timeout_ms"] = config.default_timeout_ms;
    root["metrics_window_size"] = config.metrics_window_size;

    root["routing"] = {
        {"cost", config.routing.cost},
        {"latency", config.routing.latency},
        {"quality", config.routing.quality},
        {"reliability", config.routing.reliability}
    };

    root["circuit_breaker"] = {
        {"failure_threshold", config.circuit_breaker.failure_threshold},
        {"success_threshold", config.circuit_breaker.success_threshold},
        {"timeout_ms", config.circuit_breaker.timeout_ms},
        {"half_open_max_calls", config.circuit_breaker.half_open_max_calls}
    };

    root["retry"] = {
        {"max_retries", config.retry.max_retries},
        {"base_delay_ms", config.retry.base_delay_ms},
        {"max_delay_ms", config.retry.max_delay_ms},
        {"backoff_multiplier", config.retry.backoff_multiplier},
        {"jitter", config.retry.jitter},
        {"retry_on_timeout", config.retry.retry_on_timeout},
        {"retry_on_rate_limit", config.retry.retry_on_rate_limit}
    };

    root["cache"] = {
        {"enabled", config.cache.enabled},
        {"ttl_seconds", config.cache.ttl_seconds},
        {"max_entries", config.cache.max_entries},
        {"hit_cost_reduction", config.cache.hit_cost_reduction},
        {"shards", config.cache.shards}
    };

    json budget = json::object();
    if (config.budget.hourly_budget_usd) {
        budget["hourly_budget_usd"] = *config.budget.hourly_budget_usd;
    } else {
        budget["hourly_budget_usd"] = nullptr;
    }
    root["budget"] = budget;

    root["admission"] = {
        {"max_concurrent_requests", config.admission.max_concurrent_requests},
        {"policy", policy_name(config.admission.policy)},
        {"queue_timeout_ms", config.admission.queue_timeout_ms}
    };

    return root.dump(2);
}

Result<void> validate_config(const LoadBalancerConfig& config) {
    const auto& w = config.routing;
    if (w.cost < 0 || w.latency < 0 || w.quality < 0 || w.reliability < 0) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Routing weights must be non-negative");
    }

    const auto& cb = config.circuit_breaker;
    if (cb.failure_threshold == 0 || cb.success_threshold == 0) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Circuit breaker thresholds must be positive");
    }
    if (cb.half_open_max_calls == 0) {
        return Error(ErrorCode::INVALID_ARGUMENT, "half_open_max_calls must be positive");
    }

    const auto& r = config.retry;
    if (r.backoff_multiplier < 1.0) {
        return Error(ErrorCode::INVALID_ARGUMENT, "backoff_multiplier must be at least 1.0");
    }
    if (r.max_delay_ms < r.base_delay_ms) {
        return Error(ErrorCode::INVALID_ARGUMENT, "max_delay_ms must not be below base_delay_ms");
    }

    const auto& c = config.cache;
    if (c.hit_cost_reduction < 0.0 || c.hit_cost_reduction > 1.0) {
        return Error(ErrorCode::INVALID_ARGUMENT, "hit_cost_reduction must be within [0, 1]");
    }
    if (c.enabled && (c.max_entries == 0 || c.shards == 0)) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Cache needs positive max_entries and shards");
    }

    if (config.budget.hourly_budget_usd && *config.budget.hourly_budget_usd < 0.0) {
        return Error(ErrorCode::INVALID_ARGUMENT, "hourly_budget_usd must be non-negative");
    }

    if (config.admission.max_concurrent_requests == 0) {
        return Error(ErrorCode::INVALID_ARGUMENT, "max_concurrent_requests must be positive");
    }

    if (config.default_timeout_ms == 0) {
        return Error(ErrorCode::INVALID_ARGUMENT, "default_timeout_ms must be positive");
    }

    if (config.metrics_window_size == 0) {
        return Error(ErrorCode::INVALID_ARGUMENT, "metrics_window_size must be positive");
    }

    return Ok();
}

}  // namespace relay
