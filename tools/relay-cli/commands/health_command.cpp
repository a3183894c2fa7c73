#include "health_command.hpp"

namespace relay::cli {

void HealthCommand::setup(CLI::App& /* app */) {
    // No options
}

int HealthCommand::execute(CommandContext& ctx) {
    auto lb = open_load_balancer(ctx);
    if (!lb) {
        return RELAY_EXIT_IO_ERROR;
    }

    bool all_healthy = true;
    for (const auto& [provider, healthy] : lb->check_health()) {
        std::cout << (healthy ? "ok    " : "FAIL  ") << provider << "\n";
        all_healthy = all_healthy && healthy;
    }

    return all_healthy ? RELAY_EXIT_SUCCESS : RELAY_EXIT_UNHEALTHY;
}

}  // namespace relay::cli
