#pragma once

#include <pastebin/result.hpp>
#include <pastebin/types.hpp>

#include <chrono>
#include <string>

namespace pastebin {

/**
 * IdentifierGenerator - Derives paste ids from content and creation time.
 *
 * id = first 8 hex chars of SHA-256(content + epoch_seconds_text(instant))
 *
 * The instant keeps re-pasted content from mapping to the same id, but
 * only at microsecond resolution: identical content created at the same
 * instant derives the same id. The store resolves that collision.
 */
class IdentifierGenerator {
public:
    /**
     * Derive the id for content created at the given instant.
     * Deterministic for an identical (content, instant) pair.
     *
     * @return 8 lowercase hex characters, or INTERNAL_ERROR if hashing fails
     */
    static Result<PasteId> generate(const std::string& content,
                                    std::chrono::system_clock::time_point instant);
};

/**
 * True if s is exactly PASTE_ID_LENGTH lowercase hex characters.
 */
bool is_valid_paste_id(const std::string& s);

}  // namespace pastebin
