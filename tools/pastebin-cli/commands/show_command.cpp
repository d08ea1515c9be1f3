#include "show_command.hpp"

#include <pastebin/json.hpp>
#include <pastebin/util/time_format.hpp>

namespace pastebin::cli {

void ShowCommand::setup(CLI::App& app) {
    app.add_option("id", id_, "Paste id")
        ->required()
        ->type_name("<id>");

    app.add_flag("--json", json_, "Output the paste as JSON");
}

int ShowCommand::execute(CommandContext& ctx) {
    auto result = ctx.store->fetch_by_id(id_);
    if (!result.ok()) {
        return report_error(result.error());
    }

    const Paste& paste = result.value();

    if (json_) {
        nlohmann::json j = paste;
        // Content is arbitrary bytes; replace invalid UTF-8 rather than throw
        std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        return PASTEBIN_EXIT_SUCCESS;
    }

    std::cout << "# " << paste.title << " [" << paste.language << "]\n";
    std::cout << "# " << paste.id << "  " << format_utc(paste.created_at) << " UTC\n";
    std::cout << "\n" << paste.content;

    // Ensure trailing newline
    if (paste.content.back() != '\n') {
        std::cout << "\n";
    }

    return PASTEBIN_EXIT_SUCCESS;
}

}  // namespace pastebin::cli
