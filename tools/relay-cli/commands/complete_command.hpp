#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace relay::cli {

/**
 * Send a prompt through the load balancer and print the response.
 */
class CompleteCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "complete"; }
    std::string description() const override {
        return "Route a prompt to the best available provider";
    }

private:
    std::string prompt_;
    uint32_t max_tokens_ = 0;
    double temperature_ = -1.0;
    std::string size_;
    std::string priority_ = "normal";
    uint64_t timeout_ms_ = 0;
    int repeat_ = 1;
    bool json_ = false;
    bool show_metrics_ = false;
};

}  // namespace relay::cli
