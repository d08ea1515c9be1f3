#include "raw_command.hpp"

namespace pastebin::cli {

void RawCommand::setup(CLI::App& app) {
    app.add_option("id", id_, "Paste id")
        ->required()
        ->type_name("<id>");
}

int RawCommand::execute(CommandContext& ctx) {
    auto result = ctx.store->fetch_content_by_id(id_);
    if (!result.ok()) {
        return report_error(result.error());
    }

    const std::string& content = result.value();
    std::cout.write(content.data(), static_cast<std::streamsize>(content.size()));
    std::cout.flush();

    if (!std::cout) {
        std::cerr << "Error: Failed to write to stdout\n";
        return PASTEBIN_EXIT_IO_ERROR;
    }
    return PASTEBIN_EXIT_SUCCESS;
}

}  // namespace pastebin::cli
