#pragma once

#include <pastebin/core_types.hpp>
#include <pastebin/result.hpp>
#include <pastebin/storage/buffer_pool.hpp>
#include <pastebin/storage/page.hpp>

#include <functional>
#include <string>
#include <vector>

namespace pastebin {

/**
 * BPlusTree - A disk-based B+ tree of string keys and string values.
 *
 * Key features:
 * - Unique keys, kept in byte order
 * - Size-based splits, so entries of very different sizes share pages
 * - Forward scans along the leaf sibling chain
 *
 * Entries are never removed. The tree does not own its root page id:
 * callers persist get_root_page_id() after inserts, since a split at the
 * top grows a new root.
 */
class BPlusTree {
public:
    /**
     * Allocate an empty leaf to serve as the root of a new tree.
     *
     * @return The root page id
     */
    static Result<PageId> create(BufferPool* buffer_pool);

    /**
     * Attach to an existing tree.
     *
     * @param buffer_pool The buffer pool for page management (not owned)
     * @param root_page_id Root page of a tree made by create()
     */
    BPlusTree(BufferPool* buffer_pool, PageId root_page_id);

    BPlusTree(const BPlusTree&) = delete;
    BPlusTree& operator=(const BPlusTree&) = delete;

    /**
     * Insert a key-value pair.
     *
     * @return CONFLICT if the key exists, INVALID_ARGUMENT if the key or
     *         value exceeds the page limits
     */
    Result<void> insert(const std::string& key, const std::string& value);

    /**
     * Look up a key.
     *
     * @return The value, or NOT_FOUND
     */
    Result<std::string> find(const std::string& key) const;

    Result<bool> contains(const std::string& key) const;

    /**
     * Up to limit entries with key >= start_key, in key order.
     */
    Result<std::vector<Entry>> scan(const std::string& start_key, size_t limit) const;

    /**
     * Visit every entry in key order.
     *
     * @param callback Called for each pair; return false to stop
     */
    Result<void> for_each(
        const std::function<bool(const std::string&, const std::string&)>& callback) const;

    PageId get_root_page_id() const { return root_page_id_; }

    /**
     * Number of levels, 1 for a lone leaf.
     */
    Result<size_t> height() const;

    /**
     * Check ordering, separator bounds, uniform leaf depth and the
     * sibling chain.
     *
     * @return CORRUPTION describing the first violation found
     */
    Result<void> verify() const;

private:
    // Descend to the leaf responsible for key, recording internal pages visited
    Result<PageId> find_leaf(const std::string& key, std::vector<PageId>* path) const;

    Result<void> split_leaf(PageGuard& leaf_guard, const std::string& key,
                            const std::string& value, std::vector<PageId>& path);

    // Link a freshly split right sibling into the parent on top of path
    Result<void> insert_into_parent(std::vector<PageId>& path, PageId left_id,
                                    const std::string& separator, PageId right_id);

    Result<void> verify_node(PageId page_id, const std::string* low, const std::string* high,
                             size_t depth, size_t* leaf_depth,
                             std::vector<PageId>* leaves) const;

    BufferPool* buffer_pool_;
    PageId root_page_id_;
};

}  // namespace pastebin
