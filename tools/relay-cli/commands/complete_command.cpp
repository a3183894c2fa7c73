#include "complete_command.hpp"

#include <nlohmann/json.hpp>

namespace relay::cli {

namespace {

std::optional<Priority> parse_priority(const std::string& name) {
    if (name == "low") return Priority::LOW;
    if (name == "normal") return Priority::NORMAL;
    if (name == "high") return Priority::HIGH;
    if (name == "critical") return Priority::CRITICAL;
    return std::nullopt;
}

std::optional<ModelSize> parse_size(const std::string& name) {
    if (name == "small") return ModelSize::SMALL;
    if (name == "medium") return ModelSize::MEDIUM;
    if (name == "large") return ModelSize::LARGE;
    return std::nullopt;
}

nlohmann::json response_json(const Response& r) {
    nlohmann::json j;
    j["id"] = r.id;
    j["provider"] = r.provider;
    j["model"] = r.model;
    j["content"] = r.content;
    j["tokens_used"] = r.tokens_used;
    j["latency_ms"] = r.latency_ms;
    j["cost_usd"] = r.cost_usd;
    j["cached"] = r.cached;
    if (r.quality_score) {
        j["quality_score"] = *r.quality_score;
    }
    return j;
}

}  // namespace

void CompleteCommand::setup(CLI::App& app) {
    app.add_option("prompt", prompt_, "Prompt text (reads stdin when omitted or '-')");
    app.add_option("-m,--max-tokens", max_tokens_, "Maximum output tokens");
    app.add_option("-t,--temperature", temperature_, "Sampling temperature");
    app.add_option("-s,--size", size_, "Model size preference")
        ->check(CLI::IsMember({"small", "medium", "large"}));
    app.add_option("-p,--priority", priority_, "Request priority")
        ->check(CLI::IsMember({"low", "normal", "high", "critical"}));
    app.add_option("--timeout", timeout_ms_, "Per-attempt timeout in milliseconds");
    app.add_option("-n,--repeat", repeat_, "Send the request this many times")
        ->check(CLI::PositiveNumber);
    app.add_flag("--json", json_, "Print responses as JSON");
    app.add_flag("--metrics", show_metrics_, "Print the metrics snapshot afterwards");
}

int CompleteCommand::execute(CommandContext& ctx) {
    if (prompt_.empty() || prompt_ == "-") {
        prompt_ = read_stdin();
    }

    auto lb = open_load_balancer(ctx);
    if (!lb) {
        return RELAY_EXIT_IO_ERROR;
    }

    Request request;
    request.prompt = prompt_;
    if (max_tokens_ > 0) request.max_tokens = max_tokens_;
    if (temperature_ >= 0.0) request.temperature = temperature_;
    if (!size_.empty()) request.model_preference = parse_size(size_);
    request.priority = parse_priority(priority_).value_or(Priority::NORMAL);
    request.timeout_ms = timeout_ms_;

    int exit_code = RELAY_EXIT_SUCCESS;

    for (int i = 0; i < repeat_; ++i) {
        request.id = "cli-" + std::to_string(i + 1);

        auto result = lb->complete(request);
        if (!result.ok()) {
            std::cerr << "Error: " << result.error().to_string() << "\n";
            exit_code = RELAY_EXIT_REQUEST_FAILED;
            continue;
        }

        const auto& response = result.value();
        if (json_) {
            std::cout << response_json(response).dump(2) << "\n";
        } else {
            std::cout << response.content;
            if (!response.content.empty() && response.content.back() != '\n') {
                std::cout << "\n";
            }
            if (ctx.verbose) {
                std::cerr << "# " << response.provider << " (" << response.model << ") "
                          << response.latency_ms << "ms $" << response.cost_usd
                          << (response.cached ? " [cached]" : "") << "\n";
            }
        }
    }

    if (show_metrics_) {
        std::cout << lb->metrics().to_json() << "\n";
    }

    return exit_code;
}

}  // namespace relay::cli
