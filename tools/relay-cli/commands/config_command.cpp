#include "config_command.hpp"

namespace relay::cli {

void ConfigCommand::setup(CLI::App& /* app */) {
    // No options
}

int ConfigCommand::execute(CommandContext& ctx) {
    auto config = load_effective_config(ctx);
    if (!config) {
        return RELAY_EXIT_IO_ERROR;
    }

    std::cout << config_to_json(*config) << "\n";
    return RELAY_EXIT_SUCCESS;
}

}  // namespace relay::cli
