#include "list_command.hpp"

#include <pastebin/util/strings.hpp>
#include <pastebin/util/time_format.hpp>

#include <iomanip>

namespace pastebin::cli {

void ListCommand::setup(CLI::App& app) {
    app.add_option("-n,--limit", limit_, "Number of pastes to show (default: 10)")
        ->check(CLI::PositiveNumber);
}

int ListCommand::execute(CommandContext& ctx) {
    size_t limit = limit_ > 0 ? limit_ : ctx.store->get_config().recent_limit;

    auto pastes_result = ctx.store->list_recent(limit);
    if (!pastes_result.ok()) {
        return report_error(pastes_result.error());
    }

    auto& pastes = pastes_result.value();
    if (pastes.empty()) {
        std::cout << "No pastes yet.\n";
        std::cout << "Use 'pb create' to add the first one.\n";
        return PASTEBIN_EXIT_SUCCESS;
    }

    std::cout << std::left
              << std::setw(10) << "ID"
              << std::setw(22) << "CREATED (UTC)"
              << "TITLE\n";
    std::cout << std::string(72, '-') << "\n";

    for (const auto& p : pastes) {
        std::cout << std::left
                  << std::setw(10) << p.id
                  << std::setw(22) << format_utc(p.created_at)
                  << truncate(p.title, 40) << "\n";
    }

    std::cout << "\n" << pastes.size() << " of " << ctx.store->count() << " paste(s)\n";
    return PASTEBIN_EXIT_SUCCESS;
}

}  // namespace pastebin::cli
