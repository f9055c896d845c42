//
// Created by Giuseppe Francione on 08/12/25.
//

#include "../../include/fingerprint.hpp"
#include "../../include/byte_reader.hpp"
#include "../../include/cover_error.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <array>
#include <fstream>
#include <memory>
#include <span>

namespace coverthumb {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using unique_md_ctx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

void digest_update(EVP_MD_CTX* ctx, const void* data, const std::size_t len) {
    if (EVP_DigestUpdate(ctx, data, len) != 1) {
        throw CoverError(ErrorKind::IoError, "EVP_DigestUpdate failed");
    }
}

} // namespace

std::string compute_cache_key(std::istream& in, const std::string_view extension,
                              const std::uint32_t requested_size) {
    const std::uint64_t length = stream_length(in);

    const unique_md_ctx ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        throw CoverError(ErrorKind::IoError, "cannot initialise MD5 digest");
    }

    digest_update(ctx.get(), extension.data(), extension.size());
    const std::array<std::uint8_t, 4> size_le = {
        static_cast<std::uint8_t>(requested_size & 0xFF),
        static_cast<std::uint8_t>((requested_size >> 8) & 0xFF),
        static_cast<std::uint8_t>((requested_size >> 16) & 0xFF),
        static_cast<std::uint8_t>((requested_size >> 24) & 0xFF),
    };
    digest_update(ctx.get(), size_le.data(), size_le.size());

    std::array<std::uint8_t, kWindowSize> window{};
    for (int i = -1; i < kWindowCount; ++i) {
        const std::uint64_t offset = i < 0 ? kFirstWindowOffset : kWindowStep << (2 * i);
        if (offset >= length) break;
        const std::uint64_t end = std::min(offset + kWindowSize, length);
        const std::size_t n = static_cast<std::size_t>(end - offset);

        try {
            read_exact_at(in, offset, std::span(window.data(), n));
        } catch (const CoverError& e) {
            // the length was known up front, so a short read here is an I/O problem
            throw CoverError(ErrorKind::IoError, e.what());
        }
        digest_update(ctx.get(), window.data(), n);
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
        throw CoverError(ErrorKind::IoError, "EVP_DigestFinal_ex failed");
    }

    static constexpr char kHex[] = "0123456789abcdef";
    std::string key;
    key.reserve(digest_len * 2 + 4);
    for (unsigned int i = 0; i < digest_len; ++i) {
        key += kHex[digest[i] >> 4];
        key += kHex[digest[i] & 0x0F];
    }
    key += ".png";
    return key;
}

std::string compute_cache_key(const std::filesystem::path& path, const std::string_view extension,
                              const std::uint32_t requested_size) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw CoverError(ErrorKind::IoError, "cannot open " + path.string());
    }
    return compute_cache_key(file, extension, requested_size);
}

} // namespace coverthumb
