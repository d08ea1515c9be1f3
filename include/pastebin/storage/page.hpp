#pragma once

#include <pastebin/core_types.hpp>

#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace pastebin {

/**
 * Page Header - Common header for all data pages (32 bytes).
 *
 * Layout:
 *   [0-3]   page_id
 *   [4-7]   next_page_id (right sibling for leaves, next link for overflow)
 *   [8-11]  checksum of the data region
 *   [12-13] num_entries
 *   [14]    page_type
 *   [15-31] reserved
 */
struct PageHeader {
    PageId page_id;
    PageId next_page_id;
    uint32_t checksum;
    uint16_t num_entries;
    PageType page_type;
    uint8_t reserved[17];

    PageHeader()
        : page_id(INVALID_PAGE_ID)
        , next_page_id(INVALID_PAGE_ID)
        , checksum(0)
        , num_entries(0)
        , page_type(PageType::UNINITIALIZED) {
        std::memset(reserved, 0, sizeof(reserved));
    }
};

static_assert(sizeof(PageHeader) == 32, "PageHeader must be 32 bytes");

/**
 * Page - A 4KB unit of the database file: a 32-byte header followed by
 * a data region interpreted by LeafPage, InternalPage or OverflowPage.
 */
class Page {
public:
    static constexpr size_t HEADER_SIZE = sizeof(PageHeader);
    static constexpr size_t DATA_SIZE = PAGE_SIZE - HEADER_SIZE;

    Page() : header_(), data_() {}

    PageId get_page_id() const { return header_.page_id; }
    void set_page_id(PageId id) { header_.page_id = id; }

    PageType get_page_type() const { return header_.page_type; }
    void set_page_type(PageType type) { header_.page_type = type; }

    uint16_t get_num_entries() const { return header_.num_entries; }
    void set_num_entries(uint16_t n) { header_.num_entries = n; }

    PageId get_next_page_id() const { return header_.next_page_id; }
    void set_next_page_id(PageId id) { header_.next_page_id = id; }

    uint8_t* get_data() { return data_.data(); }
    const uint8_t* get_data() const { return data_.data(); }

    // Raw page bytes for disk I/O
    char* get_raw_data() { return reinterpret_cast<char*>(this); }
    const char* get_raw_data() const { return reinterpret_cast<const char*>(this); }

    bool is_leaf() const { return header_.page_type == PageType::LEAF; }
    bool is_internal() const { return header_.page_type == PageType::INTERNAL; }
    bool is_overflow() const { return header_.page_type == PageType::OVERFLOW_PAGE; }

    void reset() {
        header_ = PageHeader();
        data_.fill(0);
    }

    uint32_t compute_checksum() const;

    // Freshly allocated pages are all zeros and carry no checksum yet
    bool verify_checksum() const {
        return header_.page_type == PageType::UNINITIALIZED ||
               header_.checksum == compute_checksum();
    }

    void update_checksum() { header_.checksum = compute_checksum(); }

private:
    PageHeader header_;
    std::array<uint8_t, DATA_SIZE> data_;
};

static_assert(sizeof(Page) == PAGE_SIZE, "Page must be exactly PAGE_SIZE bytes");

using Entry = std::pair<std::string, std::string>;

/**
 * Leaf node view over a Page.
 *
 * Data region layout:
 * [0-1]   free_space_offset - end of the slot array
 * [2-3]   data_offset - start of key/value bytes (grows down from the end)
 * [4+]    slot array: [offset:2, key_len:2, val_len:2] per entry, sorted by key
 * [...]   key/value bytes
 *
 * The right sibling lives in the page header's next_page_id.
 */
class LeafPage {
public:
    static constexpr size_t LEAF_HEADER_SIZE = 4;
    static constexpr size_t SLOT_SIZE = 6;

    explicit LeafPage(Page* page) : page_(page) {}

    // Format the page as an empty leaf
    void init();

    PageId get_next_leaf() const { return page_->get_next_page_id(); }
    void set_next_leaf(PageId id) { page_->set_next_page_id(id); }

    size_t size() const { return page_->get_num_entries(); }

    bool has_space(size_t key_len, size_t val_len) const;

    // Insert keeping slots sorted. False if full or the key exists.
    bool insert(const std::string& key, const std::string& value);

    bool find(const std::string& key, std::string* value) const;

    // Index of the first entry whose key is >= key
    size_t lower_bound(const std::string& key) const;

    std::string key_at(size_t index) const;
    std::string value_at(size_t index) const;

    std::vector<Entry> entries() const;

    // Bytes an entry occupies including its slot
    static size_t entry_footprint(const Entry& e) {
        return SLOT_SIZE + e.first.size() + e.second.size();
    }

    // Largest footprint that fits in an empty leaf
    static constexpr size_t capacity() { return Page::DATA_SIZE - LEAF_HEADER_SIZE; }

private:
    struct Slot {
        uint16_t offset;
        uint16_t key_len;
        uint16_t val_len;
    };

    Slot get_slot(size_t index) const;
    void set_slot(size_t index, const Slot& slot);

    uint16_t read_u16(size_t pos) const;
    void write_u16(size_t pos, uint16_t v);

    Page* page_;
};

/**
 * Internal node view over a Page.
 *
 * Data region layout:
 * [0-3]   first_child - subtree for keys below key[0]
 * [4-5]   free_space_offset
 * [6-7]   data_offset
 * [8+]    slot array: [child:4, offset:2, key_len:2] per key, sorted.
 *         child of slot i holds keys >= key[i] (and < key[i+1])
 * [...]   key bytes (grow down from the end)
 */
class InternalPage {
public:
    static constexpr size_t INTERNAL_HEADER_SIZE = 8;
    static constexpr size_t SLOT_SIZE = 8;

    explicit InternalPage(Page* page) : page_(page) {}

    void init(PageId first_child);

    size_t size() const { return page_->get_num_entries(); }

    PageId get_first_child() const;

    // Child to descend into for key
    PageId find_child(const std::string& key) const;

    // 0 = first child, i = child right of key[i-1]
    PageId child_at(size_t index) const;

    std::string key_at(size_t index) const;

    bool has_space(size_t key_len) const;

    // Insert a separator key with the child to its right
    bool insert(const std::string& key, PageId right_child);

    // Separator keys paired with their right children, in order
    std::vector<std::pair<std::string, PageId>> entries() const;

    static size_t entry_footprint(const std::pair<std::string, PageId>& e) {
        return SLOT_SIZE + e.first.size();
    }

private:
    struct Slot {
        PageId child;
        uint16_t offset;
        uint16_t key_len;
    };

    Slot get_slot(size_t index) const;
    void set_slot(size_t index, const Slot& slot);

    uint16_t read_u16(size_t pos) const;
    void write_u16(size_t pos, uint16_t v);

    Page* page_;
};

/**
 * Overflow page view: one link in a chain holding a large value.
 *
 * Data region layout:
 * [0-1]   payload length in this page
 * [2+]    payload bytes
 */
class OverflowPage {
public:
    static constexpr size_t OVERFLOW_HEADER_SIZE = 2;
    static constexpr size_t PAYLOAD_CAPACITY = Page::DATA_SIZE - OVERFLOW_HEADER_SIZE;

    explicit OverflowPage(Page* page) : page_(page) {}

    void init();

    // Copy up to PAYLOAD_CAPACITY bytes; returns bytes copied
    size_t write(const char* data, size_t len);

    // Append this page's payload to out; false if the length is corrupt
    bool read(std::string* out) const;

    PageId get_next() const { return page_->get_next_page_id(); }
    void set_next(PageId id) { page_->set_next_page_id(id); }

private:
    Page* page_;
};

}  // namespace pastebin
