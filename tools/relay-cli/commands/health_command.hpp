#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace relay::cli {

/**
 * Probe every configured provider.
 */
class HealthCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "health"; }
    std::string description() const override {
        return "Run provider health checks";
    }
};

}  // namespace relay::cli
