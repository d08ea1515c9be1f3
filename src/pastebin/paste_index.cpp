#include <pastebin/paste_index.hpp>
#include <pastebin/util/serializer.hpp>
#include <pastebin/util/time_format.hpp>

#include <cstdio>

namespace pastebin {

PasteIndex::PasteIndex(BufferPool* buffer_pool, PageId primary_root, PageId recent_root)
    : primary_tree_(buffer_pool, primary_root)
    , recent_tree_(buffer_pool, recent_root)
    , overflow_(buffer_pool)
{}

std::string PasteIndex::recency_key(int64_t created_us, uint64_t sequence) {
    // Flip the sign bit so signed order matches unsigned order, then
    // invert both fields so that larger values sort first.
    uint64_t biased = static_cast<uint64_t>(created_us) ^ (uint64_t(1) << 63);

    char buf[33];
    std::snprintf(buf, sizeof(buf), "%016llx%016llx",
                  static_cast<unsigned long long>(~biased),
                  static_cast<unsigned long long>(~sequence));
    return std::string(buf, 32);
}

Result<std::string> PasteIndex::serialize(const Paste& paste) {
    BinaryWriter writer;
    writer.reserve(32 + paste.title.size() + paste.language.size() + paste.content.size());

    writer.write_int64(to_unix_micros(paste.created_at));
    writer.write_uint64(paste.sequence);

    if (!writer.write_string(paste.title) ||
        !writer.write_string(paste.language) ||
        !writer.write_string(paste.content)) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Paste field exceeds 4 GiB");
    }

    return writer.release();
}

bool PasteIndex::deserialize(const std::string& data, Paste* paste) {
    BinaryReader reader(data);

    int64_t created_us = 0;
    if (!reader.read_int64(&created_us) ||
        !reader.read_uint64(&paste->sequence) ||
        !reader.read_string(&paste->title) ||
        !reader.read_string(&paste->language) ||
        !reader.read_string(&paste->content)) {
        return false;
    }

    paste->created_at = from_unix_micros(created_us);
    return reader.remaining() == 0;
}

bool PasteIndex::deserialize_summary(const std::string& data, PasteSummary* summary) {
    BinaryReader reader(data);

    int64_t created_us = 0;
    uint64_t sequence = 0;
    if (!reader.read_int64(&created_us) ||
        !reader.read_uint64(&sequence) ||
        !reader.read_string(&summary->title)) {
        return false;
    }

    summary->created_at = from_unix_micros(created_us);
    return true;
}

Result<bool> PasteIndex::contains(const PasteId& id) const {
    return primary_tree_.contains(id);
}

Result<void> PasteIndex::insert(const Paste& paste) {
    auto exists = primary_tree_.contains(paste.id);
    if (!exists.ok()) {
        return exists.error();
    }
    if (exists.value()) {
        return Error(ErrorCode::CONFLICT, "Paste id " + paste.id + " already exists");
    }

    auto record = serialize(paste);
    if (!record.ok()) {
        return record.error();
    }

    BinaryWriter value;
    if (1 + record.value().size() <= MAX_INLINE_VALUE_SIZE) {
        value.reserve(1 + record.value().size());
        value.write_uint8(static_cast<uint8_t>(ValueTag::INLINE));
        value.write_raw(record.value().data(), record.value().size());
    } else {
        auto head = overflow_.write(record.value());
        if (!head.ok()) {
            return head.error();
        }
        value.write_uint8(static_cast<uint8_t>(ValueTag::CHAINED));
        value.write_uint32(head.value());
        value.write_uint64(record.value().size());
    }

    auto result = primary_tree_.insert(paste.id, value.data());
    if (!result.ok()) {
        return result;
    }

    return recent_tree_.insert(recency_key(to_unix_micros(paste.created_at), paste.sequence),
                               paste.id);
}

Result<std::string> PasteIndex::load_record(const PasteId& id, const std::string& value) const {
    BinaryReader reader(value);

    uint8_t tag = 0;
    if (!reader.read_uint8(&tag)) {
        return Error(ErrorCode::CORRUPTION, "Empty record for paste " + id);
    }

    switch (static_cast<ValueTag>(tag)) {
        case ValueTag::INLINE:
            return value.substr(1);

        case ValueTag::CHAINED: {
            uint32_t head = 0;
            uint64_t length = 0;
            if (!reader.read_uint32(&head) || !reader.read_uint64(&length)) {
                return Error(ErrorCode::CORRUPTION, "Truncated overflow pointer for paste " + id);
            }
            return overflow_.read(head, length);
        }
    }

    return Error(ErrorCode::CORRUPTION,
                 "Unknown record tag " + std::to_string(tag) + " for paste " + id);
}

Result<Paste> PasteIndex::get(const PasteId& id) const {
    auto value = primary_tree_.find(id);
    if (!value.ok()) {
        return value.error();
    }

    auto record = load_record(id, value.value());
    if (!record.ok()) {
        return record.error();
    }

    Paste paste;
    if (!deserialize(record.value(), &paste)) {
        return Error(ErrorCode::CORRUPTION, "Cannot decode record for paste " + id);
    }
    paste.id = id;
    return paste;
}

Result<std::string> PasteIndex::get_content(const PasteId& id) const {
    auto paste = get(id);
    if (!paste.ok()) {
        return paste.error();
    }
    return std::move(paste.value().content);
}

Result<std::vector<PasteSummary>> PasteIndex::recent(size_t limit) const {
    auto entries = recent_tree_.scan("", limit);
    if (!entries.ok()) {
        return entries.error();
    }

    std::vector<PasteSummary> result;
    result.reserve(entries.value().size());

    for (const auto& [key, id] : entries.value()) {
        auto value = primary_tree_.find(id);
        if (!value.ok()) {
            if (value.error_code() == ErrorCode::NOT_FOUND) {
                return Error(ErrorCode::CORRUPTION, "Recency entry for missing paste " + id);
            }
            return value.error();
        }

        auto record = load_record(id, value.value());
        if (!record.ok()) {
            return record.error();
        }

        PasteSummary summary;
        if (!deserialize_summary(record.value(), &summary)) {
            return Error(ErrorCode::CORRUPTION, "Cannot decode record for paste " + id);
        }
        summary.id = id;
        result.push_back(std::move(summary));
    }

    return result;
}

Result<void> PasteIndex::verify() const {
    auto result = primary_tree_.verify();
    if (!result.ok()) {
        return result;
    }
    return recent_tree_.verify();
}

}  // namespace pastebin
