#pragma once

#include <pastebin/core_types.hpp>
#include <pastebin/result.hpp>

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>

namespace pastebin {

namespace fs = std::filesystem;

/**
 * Store-level metadata persisted in the file header (page 0).
 */
struct StoreHeader {
    PageId primary_root = INVALID_PAGE_ID;   // id -> record tree
    PageId recent_root = INVALID_PAGE_ID;    // recency key -> id tree
    uint64_t paste_count = 0;
    uint64_t next_sequence = 1;
};

/**
 * DiskManager - Reads and writes fixed-size pages of the database file.
 *
 * Page 0 holds the file header (magic, version, page count and the
 * StoreHeader); every other page belongs to a B+ tree or an overflow
 * chain. Pages are only ever appended: pastes are never deleted, so
 * there is no free list.
 */
class DiskManager {
public:
    /**
     * Open an existing database file or create a new one.
     *
     * @param db_path Path to the database file
     * @return The disk manager, or IO_ERROR / CORRUPTION
     */
    static Result<std::unique_ptr<DiskManager>> open(const fs::path& db_path);

    DiskManager(const DiskManager&) = delete;
    DiskManager& operator=(const DiskManager&) = delete;

    ~DiskManager();

    /**
     * Read a page from disk into the provided buffer (PAGE_SIZE bytes).
     */
    Result<void> read_page(PageId page_id, char* data);

    /**
     * Write a page (PAGE_SIZE bytes) to disk. The page must be allocated.
     */
    Result<void> write_page(PageId page_id, const char* data);

    /**
     * Append a zeroed page to the file.
     *
     * @return The new page's ID
     */
    Result<PageId> allocate_page();

    /**
     * Flush buffered writes to the OS.
     */
    Result<void> flush();

    /**
     * Store metadata as last read or written.
     */
    StoreHeader header() const;

    /**
     * Persist new store metadata to page 0 and flush.
     */
    Result<void> write_header(const StoreHeader& header);

    PageId get_num_pages() const;

    /**
     * Forget every page at or past num_pages. Later allocations reuse
     * their slots in the file.
     */
    void truncate_to(PageId num_pages);

    const fs::path& get_db_path() const { return db_path_; }

private:
    explicit DiskManager(fs::path db_path);

    uint64_t get_file_offset(PageId page_id) const {
        return static_cast<uint64_t>(page_id) * PAGE_SIZE;
    }

    Result<void> open_file();
    Result<void> read_file_header();
    Result<void> write_file_header();

    fs::path db_path_;
    std::fstream db_file_;
    PageId num_pages_;
    StoreHeader header_;
    bool is_open_;
    mutable std::mutex mutex_;
};

}  // namespace pastebin
