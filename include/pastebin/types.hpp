#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace pastebin {

namespace fs = std::filesystem;

// Public paste identifier: 8 lowercase hex characters
using PasteId = std::string;

constexpr size_t PASTE_ID_LENGTH = 8;

constexpr const char* DEFAULT_TITLE = "Untitled";
constexpr const char* DEFAULT_LANGUAGE = "text";

/**
 * A stored paste. Immutable once created.
 */
struct Paste {
    PasteId id;
    std::string title;
    std::string content;
    std::string language;       // Display tag only, never validated
    std::chrono::system_clock::time_point created_at;
    uint64_t sequence = 0;      // Insertion order, breaks created_at ties
};

/**
 * Listing projection of a paste. Content is intentionally left out.
 */
struct PasteSummary {
    PasteId id;
    std::string title;
    std::chrono::system_clock::time_point created_at;
};

/**
 * Health payload reported by the store.
 */
struct StoreStatus {
    std::string status = "ok";
    std::string message;
    uint64_t total_pastes = 0;
};

/**
 * Configuration for opening a PasteStore.
 */
struct Config {
    fs::path root_directory;
    std::string database_file = "pastes.db";
    size_t buffer_pool_size = 256;
    // Total id derivations tried by create() before reporting a conflict
    int max_create_attempts = 3;
    size_t recent_limit = 10;
    bool verbose = false;
};

}  // namespace pastebin
