#pragma once

#include "command.hpp"

namespace pastebin::cli {

/**
 * Write a paste's content to stdout exactly as stored.
 */
class RawCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "raw"; }
    std::string description() const override {
        return "Print the raw content of a paste";
    }

private:
    std::string id_;
};

}  // namespace pastebin::cli
