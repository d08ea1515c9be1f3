#pragma once

#include <cstddef>
#include <cstdint>

namespace pastebin {

// Page identifier - unique within a database file
using PageId = uint32_t;

// Page 0 is the file header, so it doubles as the null page
constexpr PageId INVALID_PAGE_ID = 0;

// Page configuration
constexpr size_t PAGE_SIZE = 4096;  // 4KB pages, aligned to disk blocks
constexpr size_t MAX_KEY_SIZE = 64;

// Largest value stored directly in a B+ tree leaf. Anything bigger goes
// to an overflow chain and the leaf keeps a reference to it.
constexpr size_t MAX_INLINE_VALUE_SIZE = 1024;

// Kind of page stored in a frame
enum class PageType : uint8_t {
    UNINITIALIZED = 0x00,  // Default after page reset
    INTERNAL = 0x01,
    LEAF = 0x02,
    OVERFLOW_PAGE = 0x03
};

}  // namespace pastebin
