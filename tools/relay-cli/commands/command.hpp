#pragma once

#include <relay/relay.hpp>
#include <relay/providers/openai_provider.hpp>
#include <CLI/CLI.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

namespace relay::cli {

/**
 * Context passed to command execution.
 * Holds the global options shared by all subcommands.
 */
struct CommandContext {
    std::filesystem::path config_path;     // Load balancer settings (optional)
    std::filesystem::path providers_path;  // Provider list (required to dispatch)
    bool verbose = false;
};

/**
 * Base class for CLI commands.
 *
 * Each command implements:
 * - setup(): Configure CLI11 options and flags
 * - execute(): Perform the command action
 */
class Command {
public:
    virtual ~Command() = default;

    /**
     * Configure command options with CLI11.
     *
     * @param app The CLI11 subcommand to configure
     */
    virtual void setup(CLI::App& app) = 0;

    /**
     * Execute the command after argument parsing succeeds.
     *
     * @return Exit code (0 = success)
     */
    virtual int execute(CommandContext& ctx) = 0;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
};

// Helper functions used by multiple commands

/**
 * Read entire file content.
 * @return File content if successful, std::nullopt on error
 */
inline std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

/**
 * Read from stdin until EOF.
 */
inline std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

/**
 * Load the effective configuration: defaults, overlaid by the config file
 * when one was given. Prints the error to stderr on failure.
 */
inline std::optional<LoadBalancerConfig> load_effective_config(const CommandContext& ctx) {
    if (ctx.config_path.empty()) {
        return LoadBalancerConfig{};
    }

    auto result = load_config(ctx.config_path);
    if (!result.ok()) {
        std::cerr << "Error: " << result.error().to_string() << "\n";
        return std::nullopt;
    }
    return result.value();
}

/**
 * Build a load balancer from the context's config and provider files.
 * Prints the error to stderr on failure.
 *
 * @return Load balancer, or nullptr on error
 */
inline std::unique_ptr<LoadBalancer> open_load_balancer(const CommandContext& ctx) {
    auto config = load_effective_config(ctx);
    if (!config) {
        return nullptr;
    }

    if (ctx.providers_path.empty()) {
        std::cerr << "Error: --providers <file> is required\n";
        return nullptr;
    }

    auto text = read_file(ctx.providers_path);
    if (!text) {
        std::cerr << "Error: Cannot read " << ctx.providers_path.string() << "\n";
        return nullptr;
    }

    auto configs = providers::http_providers_from_json(*text);
    if (!configs.ok()) {
        std::cerr << "Error: " << configs.error().to_string() << "\n";
        return nullptr;
    }

    std::vector<ProviderPtr> list;
    for (auto& pc : configs.value()) {
        list.push_back(std::make_shared<providers::OpenAICompatibleProvider>(std::move(pc)));
    }

    auto lb = LoadBalancer::create(std::move(*config), std::move(list));
    if (!lb.ok()) {
        std::cerr << "Error: " << lb.error().to_string() << "\n";
        return nullptr;
    }
    return std::move(lb.value());
}

}  // namespace relay::cli
