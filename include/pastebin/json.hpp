#pragma once

#include <pastebin/types.hpp>

#include <nlohmann/json.hpp>

namespace pastebin {

// nlohmann/json conversions, found by ADL.
// Timestamps are rendered as UTC "YYYY-MM-DD HH:MM:SS".

void to_json(nlohmann::json& j, const StoreStatus& status);

void to_json(nlohmann::json& j, const Paste& paste);

void to_json(nlohmann::json& j, const PasteSummary& summary);

}  // namespace pastebin
