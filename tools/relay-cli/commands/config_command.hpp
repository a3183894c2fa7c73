#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace relay::cli {

/**
 * Print the effective configuration as JSON.
 */
class ConfigCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "config"; }
    std::string description() const override {
        return "Show the effective load balancer configuration";
    }
};

}  // namespace relay::cli
