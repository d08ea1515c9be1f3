#include <pastebin/util/crc32.hpp>

#include <array>

namespace pastebin {

namespace {

std::array<uint32_t, 256> build_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            crc = (crc >> 1) ^ ((crc & 1) ? 0xEDB88320u : 0u);
        }
        table[i] = crc;
    }
    return table;
}

}  // namespace

const uint32_t* CRC32::table() {
    // Function-local static: initialized once, thread-safe
    static const std::array<uint32_t, 256> table = build_table();
    return table.data();
}

uint32_t CRC32::compute(const uint8_t* data, size_t len) {
    return update(0, data, len);
}

uint32_t CRC32::compute(const char* data, size_t len) {
    return compute(reinterpret_cast<const uint8_t*>(data), len);
}

uint32_t CRC32::compute(const std::string& data) {
    return compute(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

uint32_t CRC32::update(uint32_t crc, const uint8_t* data, size_t len) {
    const uint32_t* t = table();

    crc = ~crc;
    for (size_t i = 0; i < len; ++i) {
        crc = t[(crc ^ data[i]) & 0xFF] ^ (crc >> 8);
    }
    return ~crc;
}

}  // namespace pastebin
