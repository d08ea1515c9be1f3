#include <pastebin/util/sha256.hpp>

#include <openssl/evp.h>

#include <memory>

namespace pastebin {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

}  // namespace

Result<SHA256::Digest> SHA256::digest(const std::string& data) {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return Error(ErrorCode::INTERNAL_ERROR, "EVP_MD_CTX_new failed");
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return Error(ErrorCode::INTERNAL_ERROR, "EVP_DigestInit_ex failed");
    }

    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return Error(ErrorCode::INTERNAL_ERROR, "EVP_DigestUpdate failed");
    }

    Digest out{};
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != 1 ||
        out_len != DIGEST_SIZE) {
        return Error(ErrorCode::INTERNAL_ERROR, "EVP_DigestFinal_ex failed");
    }

    return out;
}

Result<std::string> SHA256::hex_digest(const std::string& data) {
    auto result = digest(data);
    if (!result.ok()) {
        return result.error();
    }
    return to_hex(result.value().data(), DIGEST_SIZE);
}

std::string to_hex(const uint8_t* data, size_t len) {
    static const char HEX_DIGITS[] = "0123456789abcdef";

    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(HEX_DIGITS[data[i] >> 4]);
        out.push_back(HEX_DIGITS[data[i] & 0x0F]);
    }
    return out;
}

}  // namespace pastebin
