#pragma once

#include <pastebin/result.hpp>
#include <pastebin/types.hpp>
#include <pastebin/storage/btree.hpp>
#include <pastebin/storage/buffer_pool.hpp>
#include <pastebin/storage/overflow_store.hpp>

#include <string>
#include <vector>

namespace pastebin {

/**
 * PasteIndex - Maps pastes onto two B+ trees.
 *
 * Maintains:
 * - Primary: PasteId -> serialized record (inline, or a pointer to an
 *   overflow chain when the record is too large for a leaf)
 * - Recency: inverted (created_at, sequence) -> PasteId, so a forward
 *   scan yields the newest pastes first
 */
class PasteIndex {
public:
    /**
     * @param buffer_pool The buffer pool for page management
     * @param primary_root Primary tree root page ID
     * @param recent_root Recency tree root page ID
     */
    PasteIndex(BufferPool* buffer_pool, PageId primary_root, PageId recent_root);

    Result<bool> contains(const PasteId& id) const;

    /**
     * Insert a paste into both trees.
     *
     * @return CONFLICT if the id is taken
     */
    Result<void> insert(const Paste& paste);

    /**
     * @return The paste, NOT_FOUND, or CORRUPTION if the record cannot be decoded
     */
    Result<Paste> get(const PasteId& id) const;

    Result<std::string> get_content(const PasteId& id) const;

    /**
     * Up to limit pastes, newest first.
     */
    Result<std::vector<PasteSummary>> recent(size_t limit) const;

    /**
     * Structural check of both trees.
     */
    Result<void> verify() const;

    PageId get_primary_root_id() const { return primary_tree_.get_root_page_id(); }
    PageId get_recent_root_id() const { return recent_tree_.get_root_page_id(); }

    /**
     * Recency tree key: sorts newest first, insertion order breaking ties.
     */
    static std::string recency_key(int64_t created_us, uint64_t sequence);

private:
    enum class ValueTag : uint8_t {
        INLINE = 0,     // record bytes follow
        CHAINED = 1     // u32 head page, u64 record length
    };

    static Result<std::string> serialize(const Paste& paste);
    static bool deserialize(const std::string& data, Paste* paste);
    static bool deserialize_summary(const std::string& data, PasteSummary* summary);

    // Resolve a primary tree value to the record bytes it refers to
    Result<std::string> load_record(const PasteId& id, const std::string& value) const;

    BPlusTree primary_tree_;   // id -> record
    BPlusTree recent_tree_;    // recency key -> id
    OverflowStore overflow_;
};

}  // namespace pastebin
