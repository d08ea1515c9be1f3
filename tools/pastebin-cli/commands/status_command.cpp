#include "status_command.hpp"

#include <pastebin/json.hpp>

namespace pastebin::cli {

void StatusCommand::setup(CLI::App& /* app */) {
    // No options for status command
}

int StatusCommand::execute(CommandContext& ctx) {
    nlohmann::json j = ctx.store->status();
    std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    return PASTEBIN_EXIT_SUCCESS;
}

}  // namespace pastebin::cli
