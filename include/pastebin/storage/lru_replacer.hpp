#pragma once

#include <cstddef>
#include <list>
#include <optional>
#include <unordered_map>

namespace pastebin {

/**
 * LRUReplacer - Chooses which unpinned frame the buffer pool evicts.
 *
 * Frames enter when their pin count drops to zero and leave when pinned
 * again or chosen as a victim. Not synchronized; the owning BufferPool
 * calls it under its own lock.
 */
class LRUReplacer {
public:
    explicit LRUReplacer(size_t capacity);

    /**
     * Mark a frame evictable, as the most recently used.
     */
    void unpin(size_t frame_id);

    /**
     * Withdraw a frame from eviction.
     */
    void pin(size_t frame_id);

    /**
     * Remove and return the least recently used evictable frame.
     */
    std::optional<size_t> victim();

    size_t size() const { return lru_list_.size(); }

    bool contains(size_t frame_id) const {
        return frame_map_.find(frame_id) != frame_map_.end();
    }

private:
    size_t capacity_;

    // front = most recently used, back = least recently used
    std::list<size_t> lru_list_;
    std::unordered_map<size_t, std::list<size_t>::iterator> frame_map_;
};

}  // namespace pastebin
