#pragma once

#include <openssl/evp.h>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace Crypto {
inline std::string to_hex(const unsigned char* data, std::size_t n) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(n * 2);
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

// Lowercase hex SHA-256 of the file's current contents. Used to report the
// digest of a received file next to where it was saved.
inline std::string compute_file_hash(const std::filesystem::path& path, std::size_t chunk_size = 64 * 1024) {
    std::ifstream file(path, std::ifstream::binary);
    if (!file.is_open()) {
        throw std::runtime_error("[CRYPTO] Error opening file: " + path.string());
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("[CRYPTO] cannot initialise SHA-256");
    }

    std::vector<char> buffer(chunk_size == 0 ? 1 : chunk_size);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize n = file.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(n)) != 1) {
            throw std::runtime_error("[CRYPTO] digest update failed for " + path.string());
        }
    }
    if (file.bad()) {
        throw std::runtime_error("[CRYPTO] Error reading file: " + path.string());
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
        throw std::runtime_error("[CRYPTO] digest finalisation failed for " + path.string());
    }
    return to_hex(digest, len);
}
}  // namespace Crypto
