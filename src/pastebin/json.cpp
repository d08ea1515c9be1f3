#include <pastebin/json.hpp>
#include <pastebin/util/time_format.hpp>

namespace pastebin {

void to_json(nlohmann::json& j, const StoreStatus& status) {
    j = nlohmann::json{
        {"status", status.status},
        {"message", status.message},
        {"total_pastes", status.total_pastes}
    };
}

void to_json(nlohmann::json& j, const Paste& paste) {
    j = nlohmann::json{
        {"id", paste.id},
        {"title", paste.title},
        {"language", paste.language},
        {"content", paste.content},
        {"created_at", format_utc(paste.created_at)}
    };
}

void to_json(nlohmann::json& j, const PasteSummary& summary) {
    j = nlohmann::json{
        {"id", summary.id},
        {"title", summary.title},
        {"created_at", format_utc(summary.created_at)}
    };
}

}  // namespace pastebin
