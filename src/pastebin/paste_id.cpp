#include <pastebin/paste_id.hpp>
#include <pastebin/util/sha256.hpp>
#include <pastebin/util/time_format.hpp>

namespace pastebin {

Result<PasteId> IdentifierGenerator::generate(const std::string& content,
                                              std::chrono::system_clock::time_point instant) {
    auto digest = SHA256::hex_digest(content + format_epoch_seconds(instant));
    if (!digest.ok()) {
        return digest.error();
    }
    return digest.value().substr(0, PASTE_ID_LENGTH);
}

bool is_valid_paste_id(const std::string& s) {
    if (s.size() != PASTE_ID_LENGTH) {
        return false;
    }
    for (char c : s) {
        bool digit = c >= '0' && c <= '9';
        bool lower_hex = c >= 'a' && c <= 'f';
        if (!digit && !lower_hex) {
            return false;
        }
    }
    return true;
}

}  // namespace pastebin
