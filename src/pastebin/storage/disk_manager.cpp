#include <pastebin/storage/disk_manager.hpp>
#include <pastebin/util/crc32.hpp>

#include <cstddef>
#include <cstring>

namespace pastebin {

namespace {

constexpr char FILE_MAGIC[8] = {'P', 'A', 'S', 'T', 'E', 'D', 'B', '1'};
constexpr uint32_t FILE_VERSION = 1;

// On-disk layout of page 0
struct FileHeader {
    char magic[8];
    uint32_t version;
    PageId num_pages;
    PageId primary_root;
    PageId recent_root;
    uint64_t paste_count;
    uint64_t next_sequence;
    uint32_t checksum;   // CRC32 of every field above
    uint8_t padding[PAGE_SIZE - 44];
};

static_assert(sizeof(FileHeader) == PAGE_SIZE, "FileHeader must be PAGE_SIZE");
static_assert(offsetof(FileHeader, checksum) == 40, "unexpected FileHeader layout");

uint32_t header_checksum(const FileHeader& h) {
    return CRC32::compute(reinterpret_cast<const char*>(&h), offsetof(FileHeader, checksum));
}

}  // namespace

DiskManager::DiskManager(fs::path db_path)
    : db_path_(std::move(db_path))
    , num_pages_(0)
    , is_open_(false)
{}

DiskManager::~DiskManager() {
    if (is_open_) {
        db_file_.flush();
        db_file_.close();
    }
}

Result<std::unique_ptr<DiskManager>> DiskManager::open(const fs::path& db_path) {
    std::unique_ptr<DiskManager> dm(new DiskManager(db_path));
    auto result = dm->open_file();
    if (!result.ok()) {
        return result.error();
    }
    return std::move(dm);
}

Result<void> DiskManager::open_file() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    bool file_exists = fs::exists(db_path_, ec) && fs::file_size(db_path_, ec) > 0;

    if (file_exists) {
        db_file_.open(db_path_, std::ios::in | std::ios::out | std::ios::binary);
        if (!db_file_.is_open()) {
            return Error(ErrorCode::IO_ERROR, "Failed to open database file: " + db_path_.string());
        }

        auto result = read_file_header();
        if (!result.ok()) {
            db_file_.close();
            return result;
        }
    } else {
        if (db_path_.has_parent_path()) {
            fs::create_directories(db_path_.parent_path(), ec);
            if (ec) {
                return Error(ErrorCode::IO_ERROR,
                             "Failed to create database directory: " + ec.message());
            }
        }
        db_file_.open(db_path_, std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc);
        if (!db_file_.is_open()) {
            return Error(ErrorCode::IO_ERROR, "Failed to create database file: " + db_path_.string());
        }

        num_pages_ = 1;
        header_ = StoreHeader();

        auto result = write_file_header();
        if (!result.ok()) {
            db_file_.close();
            return result;
        }
    }

    is_open_ = true;
    return Ok();
}

Result<void> DiskManager::read_file_header() {
    FileHeader h;
    db_file_.seekg(0);
    db_file_.read(reinterpret_cast<char*>(&h), sizeof(h));

    if (!db_file_.good()) {
        return Error(ErrorCode::CORRUPTION, "Database file header is truncated");
    }

    if (std::memcmp(h.magic, FILE_MAGIC, sizeof(FILE_MAGIC)) != 0) {
        return Error(ErrorCode::CORRUPTION, "Not a paste database file");
    }

    if (h.version != FILE_VERSION) {
        return Error(ErrorCode::CORRUPTION,
                     "Unsupported database version " + std::to_string(h.version));
    }

    if (h.checksum != header_checksum(h)) {
        return Error(ErrorCode::CORRUPTION, "Header checksum mismatch");
    }

    if (h.num_pages == 0 ||
        h.primary_root >= h.num_pages ||
        h.recent_root >= h.num_pages) {
        return Error(ErrorCode::CORRUPTION, "Header references pages beyond end of file");
    }

    num_pages_ = h.num_pages;
    header_.primary_root = h.primary_root;
    header_.recent_root = h.recent_root;
    header_.paste_count = h.paste_count;
    header_.next_sequence = h.next_sequence;

    return Ok();
}

Result<void> DiskManager::write_file_header() {
    FileHeader h;
    std::memset(&h, 0, sizeof(h));
    std::memcpy(h.magic, FILE_MAGIC, sizeof(FILE_MAGIC));
    h.version = FILE_VERSION;
    h.num_pages = num_pages_;
    h.primary_root = header_.primary_root;
    h.recent_root = header_.recent_root;
    h.paste_count = header_.paste_count;
    h.next_sequence = header_.next_sequence;
    h.checksum = header_checksum(h);

    db_file_.seekp(0);
    db_file_.write(reinterpret_cast<const char*>(&h), sizeof(h));
    db_file_.flush();

    if (!db_file_.good()) {
        db_file_.clear();
        return Error(ErrorCode::IO_ERROR, "Failed to write file header");
    }

    return Ok();
}

Result<void> DiskManager::read_page(PageId page_id, char* data) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (page_id == INVALID_PAGE_ID) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Cannot read header page as data");
    }

    if (page_id >= num_pages_) {
        return Error(ErrorCode::CORRUPTION,
                     "Page " + std::to_string(page_id) + " is beyond end of file");
    }

    db_file_.seekg(static_cast<std::streamoff>(get_file_offset(page_id)));
    db_file_.read(data, PAGE_SIZE);

    if (!db_file_.good()) {
        db_file_.clear();
        return Error(ErrorCode::IO_ERROR, "Failed to read page " + std::to_string(page_id));
    }

    return Ok();
}

Result<void> DiskManager::write_page(PageId page_id, const char* data) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (page_id == INVALID_PAGE_ID) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Cannot write to header page");
    }

    // Only allocated pages may be written; no sparse files
    if (page_id >= num_pages_) {
        return Error(ErrorCode::INVALID_ARGUMENT,
                     "Cannot write to unallocated page " + std::to_string(page_id));
    }

    db_file_.seekp(static_cast<std::streamoff>(get_file_offset(page_id)));
    db_file_.write(data, PAGE_SIZE);

    if (!db_file_.good()) {
        db_file_.clear();
        return Error(ErrorCode::IO_ERROR, "Failed to write page " + std::to_string(page_id));
    }

    return Ok();
}

Result<PageId> DiskManager::allocate_page() {
    std::lock_guard<std::mutex> lock(mutex_);

    PageId page_id = num_pages_;

    char zero_page[PAGE_SIZE] = {0};
    db_file_.seekp(static_cast<std::streamoff>(get_file_offset(page_id)));
    db_file_.write(zero_page, PAGE_SIZE);

    if (!db_file_.good()) {
        db_file_.clear();
        return Error(ErrorCode::IO_ERROR, "Failed to extend database file");
    }

    num_pages_ = page_id + 1;
    return page_id;
}

Result<void> DiskManager::flush() {
    std::lock_guard<std::mutex> lock(mutex_);

    db_file_.flush();
    if (!db_file_.good()) {
        db_file_.clear();
        return Error(ErrorCode::IO_ERROR, "Failed to flush database file");
    }

    return Ok();
}

StoreHeader DiskManager::header() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return header_;
}

Result<void> DiskManager::write_header(const StoreHeader& header) {
    std::lock_guard<std::mutex> lock(mutex_);

    StoreHeader previous = header_;
    header_ = header;

    auto result = write_file_header();
    if (!result.ok()) {
        header_ = previous;
    }
    return result;
}

PageId DiskManager::get_num_pages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return num_pages_;
}

void DiskManager::truncate_to(PageId num_pages) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (num_pages >= 1 && num_pages < num_pages_) {
        num_pages_ = num_pages;
    }
}

}  // namespace pastebin
