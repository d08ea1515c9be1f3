#include "commands/command.hpp"
#include "commands/create_command.hpp"
#include "commands/list_command.hpp"
#include "commands/raw_command.hpp"
#include "commands/show_command.hpp"
#include "commands/status_command.hpp"

#include <memory>
#include <vector>

int main(int argc, char** argv) {
    using namespace pastebin::cli;

    CLI::App app{"pb - store and retrieve text pastes"};
    app.require_subcommand(1);

    std::string store_path;
    bool verbose = false;
    app.add_option("--store", store_path,
                   "Store directory (default: $PASTEBIN_HOME or ~/.pastebin)");
    app.add_flag("-v,--verbose", verbose, "Log store activity to stderr");

    std::vector<std::unique_ptr<Command>> commands;
    commands.push_back(std::make_unique<CreateCommand>());
    commands.push_back(std::make_unique<ShowCommand>());
    commands.push_back(std::make_unique<RawCommand>());
    commands.push_back(std::make_unique<ListCommand>());
    commands.push_back(std::make_unique<StatusCommand>());

    std::vector<std::pair<CLI::App*, Command*>> subcommands;
    for (auto& command : commands) {
        CLI::App* sub = app.add_subcommand(command->name(), command->description());
        command->setup(*sub);
        subcommands.emplace_back(sub, command.get());
    }

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    CommandContext ctx;
    ctx.verbose = verbose;
    ctx.store_path = store_path.empty() ? get_default_store_path()
                                        : std::filesystem::path(store_path);

    auto store_result = open_store(ctx.store_path, verbose);
    if (!store_result.ok()) {
        return report_error(store_result.error());
    }
    std::unique_ptr<pastebin::PasteStore> store = std::move(store_result).value();
    ctx.store = store.get();

    int exit_code = PASTEBIN_EXIT_INTERNAL;
    for (auto& [sub, command] : subcommands) {
        if (sub->parsed()) {
            exit_code = command->execute(ctx);
            break;
        }
    }

    auto closed = store->close();
    if (!closed.ok() && exit_code == PASTEBIN_EXIT_SUCCESS) {
        return report_error(closed.error());
    }
    return exit_code;
}
