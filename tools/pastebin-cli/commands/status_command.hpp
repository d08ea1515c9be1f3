#pragma once

#include "command.hpp"

namespace pastebin::cli {

/**
 * Print the store health payload as JSON.
 */
class StatusCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "status"; }
    std::string description() const override {
        return "Show store status as JSON";
    }
};

}  // namespace pastebin::cli
