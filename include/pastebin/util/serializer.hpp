#pragma once

#include <cstdint>
#include <cstring>
#include <limits>
#include <string>

namespace pastebin {

/**
 * BinaryWriter - Binary serialization into a string buffer.
 *
 * Integers are written in host byte order; the database file is not
 * meant to move between machines of different endianness.
 */
class BinaryWriter {
public:
    BinaryWriter() = default;

    void reserve(size_t size) { buffer_.reserve(size); }

    void write_uint8(uint8_t v) {
        buffer_.push_back(static_cast<char>(v));
    }

    void write_uint32(uint32_t v) {
        buffer_.append(reinterpret_cast<const char*>(&v), sizeof(v));
    }

    void write_uint64(uint64_t v) {
        buffer_.append(reinterpret_cast<const char*>(&v), sizeof(v));
    }

    void write_int64(int64_t v) {
        buffer_.append(reinterpret_cast<const char*>(&v), sizeof(v));
    }

    // Write length-prefixed string (uint32 length + data).
    // Returns false if the string is too long for the prefix.
    bool write_string(const std::string& s) {
        if (s.size() > std::numeric_limits<uint32_t>::max()) {
            return false;
        }
        write_uint32(static_cast<uint32_t>(s.size()));
        buffer_.append(s);
        return true;
    }

    void write_raw(const char* data, size_t size) {
        buffer_.append(data, size);
    }

    const std::string& data() const { return buffer_; }
    std::string release() { return std::move(buffer_); }

    size_t size() const { return buffer_.size(); }

private:
    std::string buffer_;
};

/**
 * BinaryReader - Bounds-checked reads from a binary buffer.
 * Every read returns false instead of running past the end.
 */
class BinaryReader {
public:
    explicit BinaryReader(const std::string& data)
        : ptr_(data.data())
        , end_(data.data() + data.size())
    {}

    BinaryReader(const char* data, size_t size)
        : ptr_(data)
        , end_(data + size)
    {}

    bool has_remaining(size_t size) const {
        return static_cast<size_t>(end_ - ptr_) >= size;
    }

    size_t remaining() const {
        return static_cast<size_t>(end_ - ptr_);
    }

    bool read_uint8(uint8_t* v) {
        if (!has_remaining(sizeof(*v))) return false;
        *v = static_cast<uint8_t>(*ptr_);
        ptr_ += sizeof(*v);
        return true;
    }

    bool read_uint32(uint32_t* v) {
        return read_raw(v, sizeof(*v));
    }

    bool read_uint64(uint64_t* v) {
        return read_raw(v, sizeof(*v));
    }

    bool read_int64(int64_t* v) {
        return read_raw(v, sizeof(*v));
    }

    bool read_string(std::string* s) {
        uint32_t len;
        if (!read_uint32(&len)) return false;
        if (!has_remaining(len)) return false;
        s->assign(ptr_, len);
        ptr_ += len;
        return true;
    }

    // Skip a length-prefixed string without copying it
    bool skip_string() {
        uint32_t len;
        if (!read_uint32(&len)) return false;
        if (!has_remaining(len)) return false;
        ptr_ += len;
        return true;
    }

    bool read_raw(void* data, size_t size) {
        if (!has_remaining(size)) return false;
        std::memcpy(data, ptr_, size);
        ptr_ += size;
        return true;
    }

private:
    const char* ptr_;
    const char* end_;
};

}  // namespace pastebin
