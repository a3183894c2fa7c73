#include "commands/command.hpp"
#include "commands/complete_command.hpp"
#include "commands/config_command.hpp"
#include "commands/exit_codes.hpp"
#include "commands/health_command.hpp"

#include <cstdlib>
#include <memory>
#include <vector>

namespace {

// RELAY_LOG_LEVEL selects the console level; -v forces debug
void install_logger(bool verbose) {
    auto console = std::make_shared<relay::ConsoleLogger>();

    relay::LogLevel level = relay::LogLevel::WARNING;
    if (const char* env = std::getenv("RELAY_LOG_LEVEL")) {
        level = relay::parse_log_level(env);
    }
    if (verbose) {
        level = relay::LogLevel::DEBUG;
    }

    console->set_min_level(level);
    relay::set_logger(console);
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace relay::cli;

    CLI::App app{"relay - multi-provider LLM load balancer"};
    app.require_subcommand(1);

    CommandContext ctx;
    std::string config_path;
    std::string providers_path;

    app.add_option("-c,--config", config_path, "Load balancer configuration (JSON)")
        ->check(CLI::ExistingFile);
    app.add_option("-P,--providers", providers_path, "Provider list (JSON)")
        ->check(CLI::ExistingFile);
    app.add_flag("-v,--verbose", ctx.verbose, "Verbose output");

    std::vector<std::unique_ptr<Command>> commands;
    commands.push_back(std::make_unique<CompleteCommand>());
    commands.push_back(std::make_unique<HealthCommand>());
    commands.push_back(std::make_unique<ConfigCommand>());

    std::vector<std::pair<CLI::App*, Command*>> subcommands;
    for (auto& command : commands) {
        CLI::App* sub = app.add_subcommand(command->name(), command->description());
        command->setup(*sub);
        subcommands.emplace_back(sub, command.get());
    }

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    ctx.config_path = config_path;
    ctx.providers_path = providers_path;
    install_logger(ctx.verbose);

    for (auto& [sub, command] : subcommands) {
        if (sub->parsed()) {
            return command->execute(ctx);
        }
    }

    return RELAY_EXIT_USER_ERROR;
}
