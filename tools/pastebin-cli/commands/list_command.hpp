#pragma once

#include "command.hpp"

namespace pastebin::cli {

/**
 * List the most recent pastes, newest first.
 */
class ListCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "list"; }
    std::string description() const override {
        return "List recent pastes";
    }

private:
    size_t limit_ = 0;   // 0 = use the configured default
};

}  // namespace pastebin::cli
