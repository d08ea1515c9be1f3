#pragma once

#include <pastebin/clock.hpp>
#include <pastebin/paste_index.hpp>
#include <pastebin/result.hpp>
#include <pastebin/types.hpp>
#include <pastebin/storage/buffer_pool.hpp>
#include <pastebin/storage/disk_manager.hpp>
#include <pastebin/util/logger.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace pastebin {

/**
 * PasteStore - Main API of the paste service.
 *
 * Accepts text, assigns it a short content-derived id, persists it in a
 * single paged database file and serves it back by id. Pastes are
 * immutable; there is no update or delete.
 *
 * All operations are serialized by a store-level mutex and complete
 * synchronously. A successful create() has flushed its pages and the
 * file header before returning.
 */
class PasteStore {
public:
    /**
     * Open or create a paste store, then initialize() it.
     *
     * @param config Store configuration
     * @param clock Source of creation instants (defaults to the wall clock)
     * @param logger Log sink (defaults to NullLogger, or ConsoleLogger when
     *        config.verbose is set)
     * @return The opened store, or error
     */
    static Result<std::unique_ptr<PasteStore>> open(const Config& config,
                                                    std::shared_ptr<Clock> clock = nullptr,
                                                    std::shared_ptr<Logger> logger = nullptr);

    /**
     * Close the store and flush pending changes.
     */
    Result<void> close();

    /**
     * Destructor - ensures close is called.
     */
    ~PasteStore();

    PasteStore(const PasteStore&) = delete;
    PasteStore& operator=(const PasteStore&) = delete;

    /**
     * Ensure both index trees exist and the header records them.
     * Idempotent; open() already calls it.
     *
     * @return CORRUPTION if the header names only one of the two trees
     */
    Result<void> initialize();

    // ========================================================================
    // Write
    // ========================================================================

    /**
     * Store a new paste.
     *
     * Content is kept byte-for-byte; only the emptiness check trims it.
     * A blank title becomes "Untitled" and an empty language "text".
     * If the derived id is taken, the clock is read again and a new id
     * derived, up to Config::max_create_attempts times.
     *
     * A failed create leaves no trace: pages it touched are discarded and
     * the count, the recency list and the file are as before.
     *
     * @return The new id, VALIDATION_ERROR for blank content, or CONFLICT
     */
    Result<PasteId> create(const std::string& content,
                           const std::string& title = "",
                           const std::string& language = "");

    // ========================================================================
    // Read
    // ========================================================================

    /**
     * @return The paste, or NOT_FOUND (also for malformed ids)
     */
    Result<Paste> fetch_by_id(const std::string& id) const;

    /**
     * @return Only the raw content, or NOT_FOUND
     */
    Result<std::string> fetch_content_by_id(const std::string& id) const;

    /**
     * The limit most recently created pastes, newest first, without content.
     */
    Result<std::vector<PasteSummary>> list_recent(size_t limit) const;

    /**
     * Number of stored pastes. 0 when the store is closed.
     */
    size_t count() const;

    /**
     * Health payload: status "ok" with the paste count, or "error" when
     * the store is closed.
     */
    StoreStatus status() const;

    /**
     * Full structural check of both index trees.
     */
    Result<void> verify() const;

    const fs::path& get_root_directory() const { return root_dir_; }

    const Config& get_config() const { return config_; }

    bool is_open() const;

private:
    PasteStore() = default;

    Result<void> check_open() const;

    // Persist dirty pages, then the header pointing at them
    Result<void> commit(const StoreHeader& header);

    // Discard everything since the last commit and reopen the trees at
    // the committed roots. Returns cause, or the rollback's own error.
    Error roll_back(const Error& cause);

    Config config_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<Logger> logger_;

    std::unique_ptr<DiskManager> disk_manager_;
    std::unique_ptr<BufferPool> buffer_pool_;
    std::unique_ptr<PasteIndex> paste_index_;
    StoreHeader header_;

    fs::path root_dir_;
    bool is_open_ = false;
    mutable std::mutex mutex_;
};

}  // namespace pastebin
