#pragma once

#include "command.hpp"

namespace pastebin::cli {

/**
 * Store a new paste from a file or stdin and print its id.
 */
class CreateCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "create"; }
    std::string description() const override {
        return "Create a paste from a file or stdin";
    }

private:
    std::string file_;
    bool from_stdin_ = false;
    std::string title_;
    std::string language_;
};

}  // namespace pastebin::cli
