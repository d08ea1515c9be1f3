#pragma once

#include <pastebin/core_types.hpp>
#include <pastebin/result.hpp>
#include <pastebin/storage/disk_manager.hpp>
#include <pastebin/storage/lru_replacer.hpp>
#include <pastebin/storage/page.hpp>

#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace pastebin {

class BufferPool;

/**
 * PageGuard - Scoped pin on a buffered page.
 *
 * Holding a guard keeps the page resident. The pin is released when the
 * guard is destroyed, reassigned or release()d, whichever path the caller
 * leaves by. mark_dirty() makes the release schedule a write-back.
 */
class PageGuard {
public:
    PageGuard() = default;
    PageGuard(BufferPool* pool, Page* page) : pool_(pool), page_(page) {}

    ~PageGuard() { release(); }

    PageGuard(const PageGuard&) = delete;
    PageGuard& operator=(const PageGuard&) = delete;

    PageGuard(PageGuard&& other) noexcept
        : pool_(other.pool_), page_(other.page_), dirty_(other.dirty_) {
        other.pool_ = nullptr;
        other.page_ = nullptr;
        other.dirty_ = false;
    }

    PageGuard& operator=(PageGuard&& other) noexcept {
        if (this != &other) {
            release();
            pool_ = other.pool_;
            page_ = other.page_;
            dirty_ = other.dirty_;
            other.pool_ = nullptr;
            other.page_ = nullptr;
            other.dirty_ = false;
        }
        return *this;
    }

    Page* get() const { return page_; }
    Page* operator->() const { return page_; }
    explicit operator bool() const { return page_ != nullptr; }

    PageId page_id() const {
        return page_ ? page_->get_page_id() : INVALID_PAGE_ID;
    }

    void mark_dirty() { dirty_ = true; }

    /**
     * Unpin now. Safe to call more than once.
     */
    void release();

private:
    BufferPool* pool_ = nullptr;
    Page* page_ = nullptr;
    bool dirty_ = false;
};

/**
 * BufferPool - Fixed set of in-memory page frames over a DiskManager.
 *
 * Provides:
 * - Page fetching with disk reads and checksum verification
 * - Pin/unpin semantics, exposed through PageGuard
 * - LRU eviction of unpinned pages
 * - Dirty page tracking, commit and rollback
 *
 * Pages that existed at the last commit are never evicted while they carry
 * uncommitted changes, so the disk keeps their committed image until
 * commit() overwrites it. Pages allocated since then may be written back
 * at any time; nothing committed refers to them yet.
 */
class BufferPool {
public:
    /**
     * @param pool_size Number of page frames
     * @param disk_manager The disk manager for I/O (not owned)
     */
    BufferPool(size_t pool_size, DiskManager* disk_manager);

    ~BufferPool();

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    /**
     * Pin an existing page, loading it from disk if needed.
     *
     * @return Guard on the page, or CORRUPTION / IO_ERROR / BUFFER_POOL_FULL
     */
    Result<PageGuard> fetch(PageId page_id);

    /**
     * Allocate a fresh zeroed page on disk and pin it.
     * The page starts out dirty.
     */
    Result<PageGuard> create();

    /**
     * Drop one pin. When the count reaches zero the page becomes evictable.
     *
     * @return false if the page is not resident or not pinned
     */
    bool unpin_page(PageId page_id, bool is_dirty = false);

    /**
     * Write one page back if it is dirty.
     */
    Result<void> flush_page(PageId page_id);

    /**
     * Write back every dirty page, then flush the file. Everything in the
     * pool counts as committed afterwards.
     */
    Result<void> flush_all_pages();

    /**
     * Write back every dirty page, then the file header.
     *
     * Committed pages are overwritten last. If any write fails, the
     * committed images of the pages already overwritten are put back and
     * the error is returned; the caller should then rollback().
     *
     * @return IO_ERROR, or CORRUPTION if a committed image could not be restored
     */
    Result<void> commit(const StoreHeader& header);

    /**
     * Drop every change made since the last commit: frames of modified
     * pages and of pages allocated since then are discarded, and those
     * allocations are returned to the disk manager.
     *
     * @return INTERNAL_ERROR if one of those pages is still pinned
     */
    Result<void> rollback();

    size_t get_pool_size() const { return pool_size_; }

    /**
     * Frames that are empty or hold an unpinned page.
     */
    size_t get_free_frame_count() const;

    bool contains_page(PageId page_id) const;

    /**
     * Pin count of a resident page; 0 if not resident.
     */
    uint32_t get_pin_count(PageId page_id) const;

    /**
     * Number of dirty resident pages.
     */
    size_t get_dirty_count() const;

    /**
     * Pages in the file as of the last commit.
     */
    PageId get_committed_page_count() const;

private:
    struct FrameInfo {
        PageId page_id = INVALID_PAGE_ID;
        bool is_dirty = false;
        bool uncommitted = false;   // modified since the last commit
        uint32_t pin_count = 0;
    };

    struct PageImage {
        PageId page_id;
        std::vector<char> data;
    };

    // Committed page with uncommitted changes; must stay resident
    bool is_held(const FrameInfo& info) const {
        return info.uncommitted && info.page_id < committed_pages_;
    }

    // Everything resident is now committed. Caller holds mutex_.
    void mark_committed();

    // Put committed images back after a failed commit. Caller holds mutex_.
    Error restore(const std::vector<PageImage>& images, const Error& cause);

    // Find a frame to load into, evicting if necessary. Caller holds mutex_.
    Result<size_t> acquire_frame();

    // Write a frame's page if dirty. Caller holds mutex_.
    Result<void> write_back(size_t frame_id);

    void install(size_t frame_id, PageId page_id, bool dirty);

    size_t pool_size_;
    DiskManager* disk_manager_;

    std::vector<std::unique_ptr<Page>> pages_;
    std::vector<FrameInfo> frame_info_;

    // page_id -> frame_id
    std::unordered_map<PageId, size_t> page_table_;

    std::vector<size_t> free_frames_;

    LRUReplacer replacer_;

    PageId committed_pages_;

    mutable std::mutex mutex_;
};

}  // namespace pastebin
