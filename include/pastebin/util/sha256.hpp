#pragma once

#include <pastebin/result.hpp>

#include <array>
#include <cstdint>
#include <string>

namespace pastebin {

/**
 * SHA-256 digests through OpenSSL's EVP interface.
 */
class SHA256 {
public:
    static constexpr size_t DIGEST_SIZE = 32;
    using Digest = std::array<uint8_t, DIGEST_SIZE>;

    /**
     * Digest a byte string.
     *
     * @return The 32-byte digest, or INTERNAL_ERROR if OpenSSL fails
     */
    static Result<Digest> digest(const std::string& data);

    /**
     * Digest a byte string and return it as 64 lowercase hex characters.
     */
    static Result<std::string> hex_digest(const std::string& data);
};

/**
 * Lowercase hex encoding of raw bytes.
 */
std::string to_hex(const uint8_t* data, size_t len);

}  // namespace pastebin
