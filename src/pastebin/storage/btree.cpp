#include <pastebin/storage/btree.hpp>

#include <algorithm>

namespace pastebin {

namespace {

// Deeper than any tree this page size can produce; a longer walk means a cycle
constexpr size_t MAX_TREE_DEPTH = 32;

// Number of leading items that make up roughly half of the total bytes.
// Always leaves at least one item on each side.
template<typename T, typename Footprint>
size_t split_point(const std::vector<T>& items, Footprint footprint) {
    size_t total = 0;
    for (const auto& item : items) {
        total += footprint(item);
    }

    size_t acc = 0;
    size_t count = 0;
    for (const auto& item : items) {
        acc += footprint(item);
        ++count;
        if (acc * 2 >= total) {
            break;
        }
    }
    return std::max<size_t>(1, std::min(count, items.size() - 1));
}

Error corrupt_page(PageId page_id, const std::string& what) {
    return Error(ErrorCode::CORRUPTION,
                 "Page " + std::to_string(page_id) + ": " + what);
}

}  // namespace

Result<PageId> BPlusTree::create(BufferPool* buffer_pool) {
    auto guard_result = buffer_pool->create();
    if (!guard_result.ok()) {
        return guard_result.error();
    }
    PageGuard guard = std::move(guard_result).value();

    LeafPage leaf(guard.get());
    leaf.init();
    guard.mark_dirty();
    return guard.page_id();
}

BPlusTree::BPlusTree(BufferPool* buffer_pool, PageId root_page_id)
    : buffer_pool_(buffer_pool)
    , root_page_id_(root_page_id)
{}

Result<PageId> BPlusTree::find_leaf(const std::string& key, std::vector<PageId>* path) const {
    PageId current_id = root_page_id_;

    for (size_t depth = 0; depth < MAX_TREE_DEPTH; ++depth) {
        auto guard_result = buffer_pool_->fetch(current_id);
        if (!guard_result.ok()) {
            return guard_result.error();
        }
        PageGuard guard = std::move(guard_result).value();

        if (guard->is_leaf()) {
            return current_id;
        }
        if (!guard->is_internal()) {
            return corrupt_page(current_id, "expected a tree node");
        }

        if (path) {
            path->push_back(current_id);
        }
        InternalPage internal(guard.get());
        current_id = internal.find_child(key);
        if (current_id == INVALID_PAGE_ID) {
            return corrupt_page(guard.page_id(), "null child pointer");
        }
    }

    return Error(ErrorCode::CORRUPTION, "Tree deeper than " + std::to_string(MAX_TREE_DEPTH));
}

Result<std::string> BPlusTree::find(const std::string& key) const {
    auto leaf_id = find_leaf(key, nullptr);
    if (!leaf_id.ok()) {
        return leaf_id.error();
    }

    auto guard_result = buffer_pool_->fetch(leaf_id.value());
    if (!guard_result.ok()) {
        return guard_result.error();
    }
    PageGuard guard = std::move(guard_result).value();

    LeafPage leaf(guard.get());
    std::string value;
    if (!leaf.find(key, &value)) {
        return Error(ErrorCode::NOT_FOUND, "Key not found");
    }
    return value;
}

Result<bool> BPlusTree::contains(const std::string& key) const {
    auto result = find(key);
    if (result.ok()) {
        return true;
    }
    if (result.error_code() == ErrorCode::NOT_FOUND) {
        return false;
    }
    return result.error();
}

Result<void> BPlusTree::insert(const std::string& key, const std::string& value) {
    if (key.empty() || key.size() > MAX_KEY_SIZE) {
        return Error(ErrorCode::INVALID_ARGUMENT,
                     "Key length " + std::to_string(key.size()) + " out of range");
    }
    if (value.size() > MAX_INLINE_VALUE_SIZE) {
        return Error(ErrorCode::INVALID_ARGUMENT,
                     "Value of " + std::to_string(value.size()) + " bytes must use overflow pages");
    }

    std::vector<PageId> path;
    auto leaf_id = find_leaf(key, &path);
    if (!leaf_id.ok()) {
        return leaf_id.error();
    }

    auto guard_result = buffer_pool_->fetch(leaf_id.value());
    if (!guard_result.ok()) {
        return guard_result.error();
    }
    PageGuard guard = std::move(guard_result).value();

    LeafPage leaf(guard.get());
    if (leaf.find(key, nullptr)) {
        return Error(ErrorCode::CONFLICT, "Duplicate key");
    }

    if (leaf.has_space(key.size(), value.size())) {
        leaf.insert(key, value);
        guard.mark_dirty();
        return Ok();
    }

    return split_leaf(guard, key, value, path);
}

Result<void> BPlusTree::split_leaf(PageGuard& leaf_guard, const std::string& key,
                                   const std::string& value, std::vector<PageId>& path) {
    // Allocate first so a failure leaves the full leaf untouched
    auto right_result = buffer_pool_->create();
    if (!right_result.ok()) {
        return right_result.error();
    }
    PageGuard right_guard = std::move(right_result).value();

    LeafPage left(leaf_guard.get());
    std::vector<Entry> all = left.entries();
    auto pos = std::lower_bound(all.begin(), all.end(), key,
                                [](const Entry& e, const std::string& k) { return e.first < k; });
    all.insert(pos, Entry(key, value));

    size_t left_count = split_point(all, &LeafPage::entry_footprint);

    PageId old_next = left.get_next_leaf();
    PageId right_id = right_guard.page_id();

    left.init();
    for (size_t i = 0; i < left_count; ++i) {
        left.insert(all[i].first, all[i].second);
    }
    left.set_next_leaf(right_id);

    LeafPage right(right_guard.get());
    right.init();
    for (size_t i = left_count; i < all.size(); ++i) {
        right.insert(all[i].first, all[i].second);
    }
    right.set_next_leaf(old_next);

    leaf_guard.mark_dirty();
    right_guard.mark_dirty();

    PageId left_id = leaf_guard.page_id();
    std::string separator = all[left_count].first;

    leaf_guard.release();
    right_guard.release();

    return insert_into_parent(path, left_id, separator, right_id);
}

Result<void> BPlusTree::insert_into_parent(std::vector<PageId>& path, PageId left_id,
                                           const std::string& separator, PageId right_id) {
    if (path.empty()) {
        // Split reached the top: grow a new root above both halves
        auto root_result = buffer_pool_->create();
        if (!root_result.ok()) {
            return root_result.error();
        }
        PageGuard root_guard = std::move(root_result).value();

        InternalPage root(root_guard.get());
        root.init(left_id);
        root.insert(separator, right_id);
        root_guard.mark_dirty();

        root_page_id_ = root_guard.page_id();
        return Ok();
    }

    PageId parent_id = path.back();
    path.pop_back();

    auto parent_result = buffer_pool_->fetch(parent_id);
    if (!parent_result.ok()) {
        return parent_result.error();
    }
    PageGuard parent_guard = std::move(parent_result).value();

    InternalPage parent(parent_guard.get());
    if (parent.has_space(separator.size())) {
        parent.insert(separator, right_id);
        parent_guard.mark_dirty();
        return Ok();
    }

    auto sibling_result = buffer_pool_->create();
    if (!sibling_result.ok()) {
        return sibling_result.error();
    }
    PageGuard sibling_guard = std::move(sibling_result).value();

    using Separator = std::pair<std::string, PageId>;
    std::vector<Separator> all = parent.entries();
    auto pos = std::lower_bound(all.begin(), all.end(), separator,
                                [](const Separator& e, const std::string& k) { return e.first < k; });
    all.insert(pos, Separator(separator, right_id));

    // The middle key moves up; its child becomes the sibling's first child
    size_t middle = std::min(split_point(all, &InternalPage::entry_footprint), all.size() - 2);

    PageId first_child = parent.get_first_child();
    parent.init(first_child);
    for (size_t i = 0; i < middle; ++i) {
        parent.insert(all[i].first, all[i].second);
    }

    InternalPage sibling(sibling_guard.get());
    sibling.init(all[middle].second);
    for (size_t i = middle + 1; i < all.size(); ++i) {
        sibling.insert(all[i].first, all[i].second);
    }

    parent_guard.mark_dirty();
    sibling_guard.mark_dirty();

    PageId sibling_id = sibling_guard.page_id();
    std::string pushed_up = all[middle].first;

    parent_guard.release();
    sibling_guard.release();

    return insert_into_parent(path, parent_id, pushed_up, sibling_id);
}

Result<std::vector<Entry>> BPlusTree::scan(const std::string& start_key, size_t limit) const {
    std::vector<Entry> result;
    if (limit == 0) {
        return result;
    }

    auto leaf_id = find_leaf(start_key, nullptr);
    if (!leaf_id.ok()) {
        return leaf_id.error();
    }

    PageId current_id = leaf_id.value();
    bool first = true;

    while (current_id != INVALID_PAGE_ID && result.size() < limit) {
        auto guard_result = buffer_pool_->fetch(current_id);
        if (!guard_result.ok()) {
            return guard_result.error();
        }
        PageGuard guard = std::move(guard_result).value();
        if (!guard->is_leaf()) {
            return corrupt_page(current_id, "sibling chain left the leaf level");
        }

        LeafPage leaf(guard.get());
        size_t i = first ? leaf.lower_bound(start_key) : 0;
        first = false;

        for (; i < leaf.size() && result.size() < limit; ++i) {
            result.emplace_back(leaf.key_at(i), leaf.value_at(i));
        }

        current_id = leaf.get_next_leaf();
    }

    return result;
}

Result<void> BPlusTree::for_each(
    const std::function<bool(const std::string&, const std::string&)>& callback) const {
    auto leaf_id = find_leaf("", nullptr);
    if (!leaf_id.ok()) {
        return leaf_id.error();
    }

    PageId current_id = leaf_id.value();
    while (current_id != INVALID_PAGE_ID) {
        auto guard_result = buffer_pool_->fetch(current_id);
        if (!guard_result.ok()) {
            return guard_result.error();
        }
        PageGuard guard = std::move(guard_result).value();
        if (!guard->is_leaf()) {
            return corrupt_page(current_id, "sibling chain left the leaf level");
        }

        LeafPage leaf(guard.get());
        std::vector<Entry> entries = leaf.entries();
        current_id = leaf.get_next_leaf();
        guard.release();

        for (const auto& [key, value] : entries) {
            if (!callback(key, value)) {
                return Ok();
            }
        }
    }

    return Ok();
}

Result<size_t> BPlusTree::height() const {
    std::vector<PageId> path;
    auto leaf_id = find_leaf("", &path);
    if (!leaf_id.ok()) {
        return leaf_id.error();
    }
    return path.size() + 1;
}

Result<void> BPlusTree::verify() const {
    size_t leaf_depth = 0;
    std::vector<PageId> leaves;

    auto result = verify_node(root_page_id_, nullptr, nullptr, 1, &leaf_depth, &leaves);
    if (!result.ok()) {
        return result;
    }

    for (size_t i = 0; i < leaves.size(); ++i) {
        auto guard_result = buffer_pool_->fetch(leaves[i]);
        if (!guard_result.ok()) {
            return guard_result.error();
        }
        PageGuard guard = std::move(guard_result).value();

        PageId expected = i + 1 < leaves.size() ? leaves[i + 1] : INVALID_PAGE_ID;
        if (LeafPage(guard.get()).get_next_leaf() != expected) {
            return corrupt_page(leaves[i], "broken sibling link");
        }
    }

    return Ok();
}

Result<void> BPlusTree::verify_node(PageId page_id, const std::string* low,
                                    const std::string* high, size_t depth,
                                    size_t* leaf_depth, std::vector<PageId>* leaves) const {
    if (depth > MAX_TREE_DEPTH) {
        return Error(ErrorCode::CORRUPTION, "Tree deeper than " + std::to_string(MAX_TREE_DEPTH));
    }

    auto guard_result = buffer_pool_->fetch(page_id);
    if (!guard_result.ok()) {
        return guard_result.error();
    }
    PageGuard guard = std::move(guard_result).value();

    auto in_bounds = [&](const std::string& key) {
        return (!low || key >= *low) && (!high || key < *high);
    };

    if (guard->is_leaf()) {
        LeafPage leaf(guard.get());
        for (size_t i = 0; i < leaf.size(); ++i) {
            std::string key = leaf.key_at(i);
            if (!in_bounds(key)) {
                return corrupt_page(page_id, "key outside parent bounds");
            }
            if (i > 0 && !(leaf.key_at(i - 1) < key)) {
                return corrupt_page(page_id, "keys out of order");
            }
        }

        if (*leaf_depth == 0) {
            *leaf_depth = depth;
        } else if (*leaf_depth != depth) {
            return corrupt_page(page_id, "leaf at uneven depth");
        }
        leaves->push_back(page_id);
        return Ok();
    }

    if (!guard->is_internal()) {
        return corrupt_page(page_id, "expected a tree node");
    }

    InternalPage internal(guard.get());
    auto separators = internal.entries();
    PageId first_child = internal.get_first_child();
    guard.release();

    for (size_t i = 0; i < separators.size(); ++i) {
        if (!in_bounds(separators[i].first)) {
            return corrupt_page(page_id, "separator outside parent bounds");
        }
        if (i > 0 && !(separators[i - 1].first < separators[i].first)) {
            return corrupt_page(page_id, "separators out of order");
        }
    }

    for (size_t i = 0; i <= separators.size(); ++i) {
        PageId child = i == 0 ? first_child : separators[i - 1].second;
        const std::string* child_low = i == 0 ? low : &separators[i - 1].first;
        const std::string* child_high = i < separators.size() ? &separators[i].first : high;

        auto result = verify_node(child, child_low, child_high, depth + 1, leaf_depth, leaves);
        if (!result.ok()) {
            return result;
        }
    }

    return Ok();
}

}  // namespace pastebin
