#include "create_command.hpp"

namespace pastebin::cli {

void CreateCommand::setup(CLI::App& app) {
    app.add_option("file", file_, "File to paste")
        ->type_name("<path>");

    app.add_flag("--stdin", from_stdin_, "Read content from stdin");
    app.add_option("-t,--title", title_, "Paste title (default: Untitled)");
    app.add_option("-l,--language", language_, "Language tag (default: text)");
}

int CreateCommand::execute(CommandContext& ctx) {
    if (!file_.empty() && from_stdin_) {
        std::cerr << "Error: Give either a file or --stdin, not both\n";
        return PASTEBIN_EXIT_USER_ERROR;
    }

    std::string content;
    if (!file_.empty()) {
        auto file_content = read_file(file_);
        if (!file_content) {
            std::cerr << "Error: Cannot read file: " << file_ << "\n";
            return PASTEBIN_EXIT_IO_ERROR;
        }
        content = std::move(*file_content);
    } else if (from_stdin_) {
        content = read_stdin();
    } else {
        std::cerr << "Error: No content. Pass a file or --stdin\n";
        return PASTEBIN_EXIT_USER_ERROR;
    }

    auto result = ctx.store->create(content, title_, language_);
    if (!result.ok()) {
        return report_error(result.error());
    }

    std::cout << result.value() << "\n";
    return PASTEBIN_EXIT_SUCCESS;
}

}  // namespace pastebin::cli
