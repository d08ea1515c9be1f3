#pragma once

#include "command.hpp"

namespace pastebin::cli {

/**
 * Display a paste with its title, language and creation time.
 */
class ShowCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "show"; }
    std::string description() const override {
        return "Show a paste by id";
    }

private:
    std::string id_;
    bool json_ = false;
};

}  // namespace pastebin::cli
