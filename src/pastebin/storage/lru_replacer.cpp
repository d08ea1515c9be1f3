#include <pastebin/storage/lru_replacer.hpp>

namespace pastebin {

LRUReplacer::LRUReplacer(size_t capacity)
    : capacity_(capacity)
{
    frame_map_.reserve(capacity);
}

void LRUReplacer::unpin(size_t frame_id) {
    if (frame_id >= capacity_) {
        return;
    }

    auto it = frame_map_.find(frame_id);
    if (it != frame_map_.end()) {
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        return;
    }

    lru_list_.push_front(frame_id);
    frame_map_.emplace(frame_id, lru_list_.begin());
}

void LRUReplacer::pin(size_t frame_id) {
    auto it = frame_map_.find(frame_id);
    if (it == frame_map_.end()) {
        return;
    }
    lru_list_.erase(it->second);
    frame_map_.erase(it);
}

std::optional<size_t> LRUReplacer::victim() {
    if (lru_list_.empty()) {
        return std::nullopt;
    }

    size_t frame_id = lru_list_.back();
    lru_list_.pop_back();
    frame_map_.erase(frame_id);
    return frame_id;
}

}  // namespace pastebin
