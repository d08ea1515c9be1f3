#pragma once

#include <pastebin/core_types.hpp>
#include <pastebin/result.hpp>
#include <pastebin/storage/buffer_pool.hpp>

#include <string>

namespace pastebin {

/**
 * OverflowStore - Values too large for a leaf, kept in chains of
 * overflow pages linked through next_page_id.
 *
 * The caller keeps the head page id and total length; a chain carries
 * no length of its own beyond the per-page payload counts.
 */
class OverflowStore {
public:
    explicit OverflowStore(BufferPool* buffer_pool) : buffer_pool_(buffer_pool) {}

    /**
     * Write bytes into a fresh chain.
     *
     * @return Head page id of the chain
     */
    Result<PageId> write(const std::string& bytes);

    /**
     * Read a chain back.
     *
     * @return CORRUPTION if the chain is shorter or longer than length
     */
    Result<std::string> read(PageId head, uint64_t length) const;

private:
    BufferPool* buffer_pool_;
};

}  // namespace pastebin
