#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace pastebin {

/**
 * CRC32 (IEEE 802.3 polynomial) used for page and header checksums.
 */
class CRC32 {
public:
    static uint32_t compute(const uint8_t* data, size_t len);
    static uint32_t compute(const char* data, size_t len);
    static uint32_t compute(const std::string& data);

    /**
     * Update a running CRC32 with more data.
     */
    static uint32_t update(uint32_t crc, const uint8_t* data, size_t len);

private:
    static const uint32_t* table();
};

}  // namespace pastebin
