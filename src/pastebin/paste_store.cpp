#include <pastebin/paste_store.hpp>
#include <pastebin/paste_id.hpp>
#include <pastebin/storage/btree.hpp>
#include <pastebin/util/strings.hpp>
#include <pastebin/util/time_format.hpp>

namespace pastebin {

namespace {

// A create keeps the committed pages it modifies resident until commit:
// the split path of both trees, plus three pins for the deepest split.
constexpr size_t MIN_BUFFER_POOL_SIZE = 16;

}  // namespace

PasteStore::~PasteStore() {
    auto result = close();
    if (!result.ok() && logger_) {
        logger_->error("Close failed: " + result.error().to_string());
    }
}

Result<std::unique_ptr<PasteStore>> PasteStore::open(const Config& config,
                                                     std::shared_ptr<Clock> clock,
                                                     std::shared_ptr<Logger> logger) {
    if (config.buffer_pool_size < MIN_BUFFER_POOL_SIZE) {
        return Error(ErrorCode::INVALID_ARGUMENT,
                     "buffer_pool_size must be at least " + std::to_string(MIN_BUFFER_POOL_SIZE));
    }
    if (config.max_create_attempts < 1) {
        return Error(ErrorCode::INVALID_ARGUMENT, "max_create_attempts must be at least 1");
    }

    auto store = std::unique_ptr<PasteStore>(new PasteStore());
    store->config_ = config;
    store->clock_ = clock ? std::move(clock) : std::make_shared<SystemClock>();

    if (logger) {
        store->logger_ = std::move(logger);
    } else if (config.verbose) {
        auto console = std::make_shared<ConsoleLogger>();
        console->set_min_level(LogLevel::DEBUG);
        store->logger_ = console;
    } else {
        store->logger_ = std::make_shared<NullLogger>();
    }

    std::error_code ec;
    fs::create_directories(config.root_directory, ec);
    if (ec) {
        return Error(ErrorCode::IO_ERROR,
                     "Failed to create root directory: " + ec.message());
    }

    store->root_dir_ = config.root_directory;

    auto dm = DiskManager::open(config.root_directory / config.database_file);
    if (!dm.ok()) {
        store->logger_->error("Cannot open database: " + dm.error().to_string());
        return dm.error();
    }
    store->disk_manager_ = std::move(dm).value();

    store->buffer_pool_ = std::make_unique<BufferPool>(
        config.buffer_pool_size, store->disk_manager_.get());
    store->header_ = store->disk_manager_->header();
    store->is_open_ = true;

    auto init = store->initialize();
    if (!init.ok()) {
        store->logger_->error("Cannot initialize store: " + init.error().to_string());
        return init.error();
    }

    store->logger_->info("Paste store opened at " + config.root_directory.string() +
                         " (" + std::to_string(store->header_.paste_count) + " pastes)");

    return std::move(store);
}

Result<void> PasteStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_open_) {
        return Ok();
    }
    is_open_ = false;

    Result<void> result = Ok();
    if (buffer_pool_) {
        result = buffer_pool_->flush_all_pages();
    }

    paste_index_.reset();
    buffer_pool_.reset();
    disk_manager_.reset();

    logger_->debug("Paste store closed");
    return result;
}

bool PasteStore::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_open_;
}

Result<void> PasteStore::check_open() const {
    if (!is_open_ || !paste_index_) {
        return Error(ErrorCode::STORE_NOT_OPEN, "Store is not open");
    }
    return Ok();
}

Result<void> PasteStore::commit(const StoreHeader& header) {
    return buffer_pool_->commit(header);
}

Error PasteStore::roll_back(const Error& cause) {
    auto rolled_back = buffer_pool_->rollback();
    if (!rolled_back.ok()) {
        logger_->error("Rollback failed: " + rolled_back.error().to_string());
        return rolled_back.error();
    }

    if (header_.primary_root != INVALID_PAGE_ID) {
        paste_index_ = std::make_unique<PasteIndex>(
            buffer_pool_.get(), header_.primary_root, header_.recent_root);
    } else {
        paste_index_.reset();
    }
    return cause;
}

Result<void> PasteStore::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!is_open_) {
        return Error(ErrorCode::STORE_NOT_OPEN, "Store is not open");
    }

    bool has_primary = header_.primary_root != INVALID_PAGE_ID;
    bool has_recent = header_.recent_root != INVALID_PAGE_ID;

    if (has_primary != has_recent) {
        return Error(ErrorCode::CORRUPTION, "Header names only one of the two index trees");
    }

    if (!has_primary) {
        if (header_.paste_count != 0) {
            return Error(ErrorCode::CORRUPTION, "Header counts pastes but has no index");
        }

        auto primary_root = BPlusTree::create(buffer_pool_.get());
        if (!primary_root.ok()) {
            return roll_back(primary_root.error());
        }
        auto recent_root = BPlusTree::create(buffer_pool_.get());
        if (!recent_root.ok()) {
            return roll_back(recent_root.error());
        }

        StoreHeader header = header_;
        header.primary_root = primary_root.value();
        header.recent_root = recent_root.value();

        auto result = commit(header);
        if (!result.ok()) {
            return roll_back(result.error());
        }
        header_ = header;
        paste_index_.reset();
        logger_->debug("Created index trees at pages " + std::to_string(header.primary_root) +
                       " and " + std::to_string(header.recent_root));
    }

    if (!paste_index_) {
        paste_index_ = std::make_unique<PasteIndex>(
            buffer_pool_.get(), header_.primary_root, header_.recent_root);
    }

    return Ok();
}

Result<PasteId> PasteStore::create(const std::string& content,
                                   const std::string& title,
                                   const std::string& language) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto state = check_open();
    if (!state.ok()) {
        return state.error();
    }

    if (is_blank(content)) {
        return Error(ErrorCode::VALIDATION_ERROR, "Content cannot be empty");
    }

    Paste paste;
    paste.title = trim(title);
    if (paste.title.empty()) {
        paste.title = DEFAULT_TITLE;
    }
    paste.language = language.empty() ? std::string(DEFAULT_LANGUAGE) : language;
    paste.content = content;

    for (int attempt = 1; attempt <= config_.max_create_attempts; ++attempt) {
        // Stored with microsecond precision; derive the id from the same value
        auto instant = from_unix_micros(to_unix_micros(clock_->now()));

        auto id = IdentifierGenerator::generate(content, instant);
        if (!id.ok()) {
            logger_->error("Id derivation failed: " + id.error().to_string());
            return id.error();
        }

        auto taken = paste_index_->contains(id.value());
        if (!taken.ok()) {
            logger_->error("Id lookup failed: " + taken.error().to_string());
            return taken.error();
        }
        if (taken.value()) {
            logger_->warning("Id " + id.value() + " already taken (attempt " +
                             std::to_string(attempt) + " of " +
                             std::to_string(config_.max_create_attempts) + ")");
            continue;
        }

        paste.id = id.value();
        paste.created_at = instant;
        paste.sequence = header_.next_sequence;

        auto inserted = paste_index_->insert(paste);
        if (!inserted.ok()) {
            logger_->error("Insert of paste " + paste.id + " failed: " + inserted.error().to_string());
            return roll_back(inserted.error());
        }

        StoreHeader header = header_;
        header.primary_root = paste_index_->get_primary_root_id();
        header.recent_root = paste_index_->get_recent_root_id();
        header.paste_count += 1;
        header.next_sequence += 1;

        auto committed = commit(header);
        if (!committed.ok()) {
            logger_->error("Commit of paste " + paste.id + " failed: " + committed.error().to_string());
            return roll_back(committed.error());
        }
        header_ = header;

        logger_->debug("Created paste " + paste.id + " (" + std::to_string(content.size()) +
                       " bytes, seq " + std::to_string(paste.sequence) + ")");
        return paste.id;
    }

    return Error(ErrorCode::CONFLICT,
                 "Id collided on all " + std::to_string(config_.max_create_attempts) + " attempts");
}

Result<Paste> PasteStore::fetch_by_id(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto state = check_open();
    if (!state.ok()) {
        return state.error();
    }

    if (!is_valid_paste_id(id)) {
        return Error(ErrorCode::NOT_FOUND, "Paste not found: " + id);
    }

    auto paste = paste_index_->get(id);
    if (!paste.ok() && paste.error_code() == ErrorCode::NOT_FOUND) {
        return Error(ErrorCode::NOT_FOUND, "Paste not found: " + id);
    }
    return paste;
}

Result<std::string> PasteStore::fetch_content_by_id(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto state = check_open();
    if (!state.ok()) {
        return state.error();
    }

    if (!is_valid_paste_id(id)) {
        return Error(ErrorCode::NOT_FOUND, "Paste not found: " + id);
    }

    auto content = paste_index_->get_content(id);
    if (!content.ok() && content.error_code() == ErrorCode::NOT_FOUND) {
        return Error(ErrorCode::NOT_FOUND, "Paste not found: " + id);
    }
    return content;
}

Result<std::vector<PasteSummary>> PasteStore::list_recent(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto state = check_open();
    if (!state.ok()) {
        return state.error();
    }

    return paste_index_->recent(limit);
}

size_t PasteStore::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_open_) {
        return 0;
    }
    return static_cast<size_t>(header_.paste_count);
}

StoreStatus PasteStore::status() const {
    std::lock_guard<std::mutex> lock(mutex_);

    StoreStatus status;
    if (!is_open_) {
        status.status = "error";
        status.message = "Store is not open";
        return status;
    }

    status.message = "Paste store at " + root_dir_.string();
    status.total_pastes = header_.paste_count;
    return status;
}

Result<void> PasteStore::verify() const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto state = check_open();
    if (!state.ok()) {
        return state;
    }
    return paste_index_->verify();
}

}  // namespace pastebin
