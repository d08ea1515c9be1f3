#include <pastebin/storage/overflow_store.hpp>

#include <pastebin/storage/page.hpp>

#include <algorithm>

namespace pastebin {

Result<PageId> OverflowStore::write(const std::string& bytes) {
    if (bytes.empty()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Overflow chain needs at least one byte");
    }

    PageId head = INVALID_PAGE_ID;
    PageGuard prev;
    size_t offset = 0;

    while (offset < bytes.size()) {
        auto guard_result = buffer_pool_->create();
        if (!guard_result.ok()) {
            return guard_result.error();
        }
        PageGuard guard = std::move(guard_result).value();

        OverflowPage page(guard.get());
        page.init();
        offset += page.write(bytes.data() + offset, bytes.size() - offset);
        guard.mark_dirty();

        if (prev) {
            OverflowPage(prev.get()).set_next(guard.page_id());
            prev.mark_dirty();
        } else {
            head = guard.page_id();
        }
        prev = std::move(guard);
    }

    return head;
}

Result<std::string> OverflowStore::read(PageId head, uint64_t length) const {
    std::string out;
    out.reserve(static_cast<size_t>(std::min<uint64_t>(length, 1u << 20)));

    // Each page carries at least one byte, so a chain can have at most length pages
    uint64_t pages_left = length;
    PageId current_id = head;

    while (current_id != INVALID_PAGE_ID) {
        if (pages_left == 0) {
            return Error(ErrorCode::CORRUPTION, "Overflow chain longer than recorded length");
        }
        --pages_left;

        auto guard_result = buffer_pool_->fetch(current_id);
        if (!guard_result.ok()) {
            return guard_result.error();
        }
        PageGuard guard = std::move(guard_result).value();

        if (!guard->is_overflow()) {
            return Error(ErrorCode::CORRUPTION,
                         "Page " + std::to_string(current_id) + " is not an overflow page");
        }

        OverflowPage page(guard.get());
        if (!page.read(&out)) {
            return Error(ErrorCode::CORRUPTION,
                         "Page " + std::to_string(current_id) + " has a bad payload length");
        }
        current_id = page.get_next();
    }

    if (out.size() != length) {
        return Error(ErrorCode::CORRUPTION,
                     "Overflow chain holds " + std::to_string(out.size()) +
                     " bytes, expected " + std::to_string(length));
    }
    return out;
}

}  // namespace pastebin
