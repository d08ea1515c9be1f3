#include <pastebin/storage/page.hpp>
#include <pastebin/util/crc32.hpp>

#include <algorithm>

namespace pastebin {

uint32_t Page::compute_checksum() const {
    // Cover the structural header fields too, so a flipped type or link
    // is caught, but not the checksum field itself.
    uint32_t crc = CRC32::compute(data_.data(), DATA_SIZE);
    PageHeader h = header_;
    h.checksum = 0;
    return CRC32::update(crc, reinterpret_cast<const uint8_t*>(&h), sizeof(h));
}

// ============================================================================
// LeafPage
// ============================================================================

uint16_t LeafPage::read_u16(size_t pos) const {
    uint16_t v;
    std::memcpy(&v, page_->get_data() + pos, sizeof(v));
    return v;
}

void LeafPage::write_u16(size_t pos, uint16_t v) {
    std::memcpy(page_->get_data() + pos, &v, sizeof(v));
}

void LeafPage::init() {
    page_->set_page_type(PageType::LEAF);
    page_->set_num_entries(0);
    page_->set_next_page_id(INVALID_PAGE_ID);
    write_u16(0, static_cast<uint16_t>(LEAF_HEADER_SIZE));
    write_u16(2, static_cast<uint16_t>(Page::DATA_SIZE));
}

LeafPage::Slot LeafPage::get_slot(size_t index) const {
    size_t pos = LEAF_HEADER_SIZE + index * SLOT_SIZE;
    return Slot{read_u16(pos), read_u16(pos + 2), read_u16(pos + 4)};
}

void LeafPage::set_slot(size_t index, const Slot& slot) {
    size_t pos = LEAF_HEADER_SIZE + index * SLOT_SIZE;
    write_u16(pos, slot.offset);
    write_u16(pos + 2, slot.key_len);
    write_u16(pos + 4, slot.val_len);
}

bool LeafPage::has_space(size_t key_len, size_t val_len) const {
    uint16_t free_start = read_u16(0);
    uint16_t data_start = read_u16(2);

    if (data_start < free_start) {
        return false;
    }
    return static_cast<size_t>(data_start - free_start) >= SLOT_SIZE + key_len + val_len;
}

std::string LeafPage::key_at(size_t index) const {
    Slot slot = get_slot(index);
    if (static_cast<size_t>(slot.offset) + slot.key_len > Page::DATA_SIZE) {
        return "";
    }
    return std::string(reinterpret_cast<const char*>(page_->get_data() + slot.offset),
                       slot.key_len);
}

std::string LeafPage::value_at(size_t index) const {
    Slot slot = get_slot(index);
    size_t start = static_cast<size_t>(slot.offset) + slot.key_len;
    if (start + slot.val_len > Page::DATA_SIZE) {
        return "";
    }
    return std::string(reinterpret_cast<const char*>(page_->get_data() + start),
                       slot.val_len);
}

size_t LeafPage::lower_bound(const std::string& key) const {
    size_t left = 0;
    size_t right = size();
    while (left < right) {
        size_t mid = left + (right - left) / 2;
        if (key_at(mid) < key) {
            left = mid + 1;
        } else {
            right = mid;
        }
    }
    return left;
}

bool LeafPage::find(const std::string& key, std::string* value) const {
    size_t pos = lower_bound(key);
    if (pos >= size() || key_at(pos) != key) {
        return false;
    }
    if (value) {
        *value = value_at(pos);
    }
    return true;
}

bool LeafPage::insert(const std::string& key, const std::string& value) {
    if (!has_space(key.size(), value.size())) {
        return false;
    }

    size_t n = size();
    size_t pos = lower_bound(key);
    if (pos < n && key_at(pos) == key) {
        return false;
    }

    for (size_t i = n; i > pos; --i) {
        set_slot(i, get_slot(i - 1));
    }

    uint16_t data_offset = static_cast<uint16_t>(read_u16(2) - key.size() - value.size());
    uint8_t* d = page_->get_data();
    std::memcpy(d + data_offset, key.data(), key.size());
    std::memcpy(d + data_offset + key.size(), value.data(), value.size());

    set_slot(pos, Slot{data_offset,
                       static_cast<uint16_t>(key.size()),
                       static_cast<uint16_t>(value.size())});

    write_u16(2, data_offset);
    write_u16(0, static_cast<uint16_t>(LEAF_HEADER_SIZE + (n + 1) * SLOT_SIZE));
    page_->set_num_entries(static_cast<uint16_t>(n + 1));
    return true;
}

std::vector<Entry> LeafPage::entries() const {
    std::vector<Entry> result;
    size_t n = size();
    result.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        result.emplace_back(key_at(i), value_at(i));
    }
    return result;
}

// ============================================================================
// InternalPage
// ============================================================================

uint16_t InternalPage::read_u16(size_t pos) const {
    uint16_t v;
    std::memcpy(&v, page_->get_data() + pos, sizeof(v));
    return v;
}

void InternalPage::write_u16(size_t pos, uint16_t v) {
    std::memcpy(page_->get_data() + pos, &v, sizeof(v));
}

void InternalPage::init(PageId first_child) {
    page_->set_page_type(PageType::INTERNAL);
    page_->set_num_entries(0);
    page_->set_next_page_id(INVALID_PAGE_ID);
    std::memcpy(page_->get_data(), &first_child, sizeof(first_child));
    write_u16(4, static_cast<uint16_t>(INTERNAL_HEADER_SIZE));
    write_u16(6, static_cast<uint16_t>(Page::DATA_SIZE));
}

PageId InternalPage::get_first_child() const {
    PageId id;
    std::memcpy(&id, page_->get_data(), sizeof(id));
    return id;
}

InternalPage::Slot InternalPage::get_slot(size_t index) const {
    size_t pos = INTERNAL_HEADER_SIZE + index * SLOT_SIZE;
    Slot slot;
    std::memcpy(&slot.child, page_->get_data() + pos, sizeof(slot.child));
    slot.offset = read_u16(pos + 4);
    slot.key_len = read_u16(pos + 6);
    return slot;
}

void InternalPage::set_slot(size_t index, const Slot& slot) {
    size_t pos = INTERNAL_HEADER_SIZE + index * SLOT_SIZE;
    std::memcpy(page_->get_data() + pos, &slot.child, sizeof(slot.child));
    write_u16(pos + 4, slot.offset);
    write_u16(pos + 6, slot.key_len);
}

std::string InternalPage::key_at(size_t index) const {
    Slot slot = get_slot(index);
    if (static_cast<size_t>(slot.offset) + slot.key_len > Page::DATA_SIZE) {
        return "";
    }
    return std::string(reinterpret_cast<const char*>(page_->get_data() + slot.offset),
                       slot.key_len);
}

PageId InternalPage::child_at(size_t index) const {
    if (index == 0) {
        return get_first_child();
    }
    return get_slot(index - 1).child;
}

PageId InternalPage::find_child(const std::string& key) const {
    // First separator strictly greater than key
    size_t left = 0;
    size_t right = size();
    while (left < right) {
        size_t mid = left + (right - left) / 2;
        if (key_at(mid) <= key) {
            left = mid + 1;
        } else {
            right = mid;
        }
    }
    return child_at(left);
}

bool InternalPage::has_space(size_t key_len) const {
    uint16_t free_start = read_u16(4);
    uint16_t data_start = read_u16(6);

    if (data_start < free_start) {
        return false;
    }
    return static_cast<size_t>(data_start - free_start) >= SLOT_SIZE + key_len;
}

bool InternalPage::insert(const std::string& key, PageId right_child) {
    if (!has_space(key.size())) {
        return false;
    }

    size_t n = size();
    size_t pos = 0;
    while (pos < n && key_at(pos) < key) {
        ++pos;
    }

    for (size_t i = n; i > pos; --i) {
        set_slot(i, get_slot(i - 1));
    }

    uint16_t data_offset = static_cast<uint16_t>(read_u16(6) - key.size());
    std::memcpy(page_->get_data() + data_offset, key.data(), key.size());

    set_slot(pos, Slot{right_child, data_offset, static_cast<uint16_t>(key.size())});

    write_u16(6, data_offset);
    write_u16(4, static_cast<uint16_t>(INTERNAL_HEADER_SIZE + (n + 1) * SLOT_SIZE));
    page_->set_num_entries(static_cast<uint16_t>(n + 1));
    return true;
}

std::vector<std::pair<std::string, PageId>> InternalPage::entries() const {
    std::vector<std::pair<std::string, PageId>> result;
    size_t n = size();
    result.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        result.emplace_back(key_at(i), get_slot(i).child);
    }
    return result;
}

// ============================================================================
// OverflowPage
// ============================================================================

void OverflowPage::init() {
    page_->set_page_type(PageType::OVERFLOW_PAGE);
    page_->set_num_entries(0);
    page_->set_next_page_id(INVALID_PAGE_ID);
    uint16_t zero = 0;
    std::memcpy(page_->get_data(), &zero, sizeof(zero));
}

size_t OverflowPage::write(const char* data, size_t len) {
    size_t n = std::min(len, PAYLOAD_CAPACITY);
    uint16_t stored = static_cast<uint16_t>(n);
    std::memcpy(page_->get_data(), &stored, sizeof(stored));
    std::memcpy(page_->get_data() + OVERFLOW_HEADER_SIZE, data, n);
    return n;
}

bool OverflowPage::read(std::string* out) const {
    uint16_t stored;
    std::memcpy(&stored, page_->get_data(), sizeof(stored));
    if (stored > PAYLOAD_CAPACITY) {
        return false;
    }
    out->append(reinterpret_cast<const char*>(page_->get_data() + OVERFLOW_HEADER_SIZE),
                stored);
    return true;
}

}  // namespace pastebin
