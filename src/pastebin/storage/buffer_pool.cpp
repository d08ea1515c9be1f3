#include <pastebin/storage/buffer_pool.hpp>

namespace pastebin {

void PageGuard::release() {
    if (pool_ && page_) {
        pool_->unpin_page(page_->get_page_id(), dirty_);
    }
    pool_ = nullptr;
    page_ = nullptr;
    dirty_ = false;
}

BufferPool::BufferPool(size_t pool_size, DiskManager* disk_manager)
    : pool_size_(pool_size)
    , disk_manager_(disk_manager)
    , replacer_(pool_size)
    , committed_pages_(disk_manager->get_num_pages())
{
    pages_.reserve(pool_size);
    frame_info_.resize(pool_size);

    // Hand out low frame numbers first
    for (size_t i = 0; i < pool_size; ++i) {
        pages_.push_back(std::make_unique<Page>());
        free_frames_.push_back(pool_size - 1 - i);
    }
}

BufferPool::~BufferPool() {
    // Destructors cannot report; PasteStore::close() flushes explicitly first
    flush_all_pages();
}

Result<PageGuard> BufferPool::fetch(PageId page_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (page_id == INVALID_PAGE_ID) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Cannot fetch the null page");
    }

    auto it = page_table_.find(page_id);
    if (it != page_table_.end()) {
        size_t frame_id = it->second;
        frame_info_[frame_id].pin_count++;
        replacer_.pin(frame_id);
        return PageGuard(this, pages_[frame_id].get());
    }

    auto frame = acquire_frame();
    if (!frame.ok()) {
        return frame.error();
    }
    size_t frame_id = frame.value();

    Page* page = pages_[frame_id].get();
    auto read = disk_manager_->read_page(page_id, page->get_raw_data());
    if (!read.ok() || !page->verify_checksum() ||
        (page->get_page_type() != PageType::UNINITIALIZED && page->get_page_id() != page_id)) {
        page->reset();
        free_frames_.push_back(frame_id);
        if (!read.ok()) {
            return read.error();
        }
        return Error(ErrorCode::CORRUPTION,
                     "Page " + std::to_string(page_id) + " failed checksum verification");
    }

    // A zeroed page read back before its first write-back
    page->set_page_id(page_id);

    install(frame_id, page_id, false);
    return PageGuard(this, page);
}

Result<PageGuard> BufferPool::create() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto frame = acquire_frame();
    if (!frame.ok()) {
        return frame.error();
    }
    size_t frame_id = frame.value();

    auto page_id = disk_manager_->allocate_page();
    if (!page_id.ok()) {
        free_frames_.push_back(frame_id);
        return page_id.error();
    }

    Page* page = pages_[frame_id].get();
    page->reset();
    page->set_page_id(page_id.value());

    install(frame_id, page_id.value(), true);
    return PageGuard(this, page);
}

void BufferPool::install(size_t frame_id, PageId page_id, bool dirty) {
    FrameInfo& info = frame_info_[frame_id];
    info.page_id = page_id;
    info.is_dirty = dirty;
    info.uncommitted = dirty;
    info.pin_count = 1;
    page_table_[page_id] = frame_id;
    replacer_.pin(frame_id);
}

bool BufferPool::unpin_page(PageId page_id, bool is_dirty) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = page_table_.find(page_id);
    if (it == page_table_.end()) {
        return false;
    }

    size_t frame_id = it->second;
    FrameInfo& info = frame_info_[frame_id];

    if (info.pin_count == 0) {
        return false;
    }

    info.pin_count--;
    if (is_dirty) {
        info.is_dirty = true;
        info.uncommitted = true;
    }

    if (info.pin_count == 0 && !is_held(info)) {
        replacer_.unpin(frame_id);
    }

    return true;
}

Result<void> BufferPool::flush_page(PageId page_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = page_table_.find(page_id);
    if (it == page_table_.end()) {
        return Ok();
    }
    return write_back(it->second);
}

Result<void> BufferPool::flush_all_pages() {
    std::lock_guard<std::mutex> lock(mutex_);

    for (size_t i = 0; i < pool_size_; ++i) {
        if (frame_info_[i].page_id == INVALID_PAGE_ID) {
            continue;
        }
        auto result = write_back(i);
        if (!result.ok()) {
            return result;
        }
    }

    auto flushed = disk_manager_->flush();
    if (!flushed.ok()) {
        return flushed;
    }

    mark_committed();
    return Ok();
}

Result<void> BufferPool::commit(const StoreHeader& header) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Held pages were never evicted, so disk still has their committed image
    std::vector<PageImage> images;
    for (const auto& info : frame_info_) {
        if (info.page_id == INVALID_PAGE_ID || !info.is_dirty ||
            info.page_id >= committed_pages_) {
            continue;
        }
        PageImage image{info.page_id, std::vector<char>(PAGE_SIZE)};
        auto read = disk_manager_->read_page(info.page_id, image.data.data());
        if (!read.ok()) {
            return read;
        }
        images.push_back(std::move(image));
    }

    // New pages first, then the committed ones in place
    for (int pass = 0; pass < 2; ++pass) {
        for (size_t i = 0; i < pool_size_; ++i) {
            const FrameInfo& info = frame_info_[i];
            if (info.page_id == INVALID_PAGE_ID) {
                continue;
            }
            bool is_new = info.page_id >= committed_pages_;
            if (is_new != (pass == 0)) {
                continue;
            }
            auto result = write_back(i);
            if (!result.ok()) {
                return restore(images, result.error());
            }
        }
    }

    auto flushed = disk_manager_->flush();
    if (!flushed.ok()) {
        return restore(images, flushed.error());
    }

    auto written = disk_manager_->write_header(header);
    if (!written.ok()) {
        return restore(images, written.error());
    }

    mark_committed();
    return Ok();
}

Error BufferPool::restore(const std::vector<PageImage>& images, const Error& cause) {
    for (const auto& image : images) {
        auto result = disk_manager_->write_page(image.page_id, image.data.data());
        if (!result.ok()) {
            return Error(ErrorCode::CORRUPTION,
                         cause.to_string() + "; page " + std::to_string(image.page_id) +
                         " could not be restored");
        }
    }

    auto flushed = disk_manager_->flush();
    if (!flushed.ok()) {
        return Error(ErrorCode::CORRUPTION,
                     cause.to_string() + "; restored pages could not be flushed");
    }
    return cause;
}

void BufferPool::mark_committed() {
    for (size_t i = 0; i < pool_size_; ++i) {
        FrameInfo& info = frame_info_[i];
        if (info.page_id == INVALID_PAGE_ID) {
            continue;
        }
        bool was_held = is_held(info);
        info.uncommitted = false;
        if (was_held && info.pin_count == 0) {
            replacer_.unpin(i);
        }
    }
    committed_pages_ = disk_manager_->get_num_pages();
}

Result<void> BufferPool::rollback() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto discarded = [this](const FrameInfo& info) {
        return info.page_id != INVALID_PAGE_ID &&
               (info.uncommitted || info.page_id >= committed_pages_);
    };

    for (const auto& info : frame_info_) {
        if (discarded(info) && info.pin_count > 0) {
            return Error(ErrorCode::INTERNAL_ERROR,
                         "Cannot roll back pinned page " + std::to_string(info.page_id));
        }
    }

    for (size_t i = 0; i < pool_size_; ++i) {
        FrameInfo& info = frame_info_[i];
        if (!discarded(info)) {
            continue;
        }
        replacer_.pin(i);
        page_table_.erase(info.page_id);
        pages_[i]->reset();
        info = FrameInfo();
        free_frames_.push_back(i);
    }

    disk_manager_->truncate_to(committed_pages_);
    return Ok();
}

Result<void> BufferPool::write_back(size_t frame_id) {
    FrameInfo& info = frame_info_[frame_id];
    if (!info.is_dirty) {
        return Ok();
    }

    Page* page = pages_[frame_id].get();
    page->update_checksum();

    auto result = disk_manager_->write_page(info.page_id, page->get_raw_data());
    if (!result.ok()) {
        return result;
    }

    info.is_dirty = false;
    return Ok();
}

Result<size_t> BufferPool::acquire_frame() {
    if (!free_frames_.empty()) {
        size_t frame_id = free_frames_.back();
        free_frames_.pop_back();
        return frame_id;
    }

    auto victim = replacer_.victim();
    if (!victim.has_value()) {
        return Error(ErrorCode::BUFFER_POOL_FULL,
                     "None of the " + std::to_string(pool_size_) + " frames can be evicted");
    }

    size_t frame_id = victim.value();
    auto result = write_back(frame_id);
    if (!result.ok()) {
        // Keep the dirty page; it stays evictable for a later attempt
        replacer_.unpin(frame_id);
        return result.error();
    }

    FrameInfo& info = frame_info_[frame_id];
    page_table_.erase(info.page_id);
    info = FrameInfo();
    return frame_id;
}

size_t BufferPool::get_free_frame_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return free_frames_.size() + replacer_.size();
}

bool BufferPool::contains_page(PageId page_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return page_table_.find(page_id) != page_table_.end();
}

uint32_t BufferPool::get_pin_count(PageId page_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = page_table_.find(page_id);
    if (it == page_table_.end()) {
        return 0;
    }
    return frame_info_[it->second].pin_count;
}

PageId BufferPool::get_committed_page_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return committed_pages_;
}

size_t BufferPool::get_dirty_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& info : frame_info_) {
        if (info.page_id != INVALID_PAGE_ID && info.is_dirty) {
            ++n;
        }
    }
    return n;
}

}  // namespace pastebin
