#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>
#include <openssl/sha.h>

namespace fakehub {

// SHA-1 (legacy git-style oid) and SHA-256 (lfs oid) of the same content.
struct FileDigests {
    std::string sha1;
    std::string sha256;
};

constexpr size_t kDefaultHashChunkBytes = 1024 * 1024;

inline std::string digest_to_hex(const unsigned char* data, size_t len) {
    static const char* hex = "0123456789abcdef";
    std::string hexout;
    hexout.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        hexout.push_back(hex[(data[i] >> 4) & 0x0F]);
        hexout.push_back(hex[data[i] & 0x0F]);
    }
    return hexout;
}

inline std::optional<FileDigests> digest_text(const std::string& text) {
    SHA_CTX sha1;
    SHA256_CTX sha256;
    if (SHA1_Init(&sha1) != 1 || SHA256_Init(&sha256) != 1) return std::nullopt;
    if (!text.empty()) {
        if (SHA1_Update(&sha1, text.data(), text.size()) != 1) return std::nullopt;
        if (SHA256_Update(&sha256, text.data(), text.size()) != 1) return std::nullopt;
    }
    std::array<unsigned char, SHA_DIGEST_LENGTH> h1{};
    std::array<unsigned char, SHA256_DIGEST_LENGTH> h256{};
    if (SHA1_Final(h1.data(), &sha1) != 1) return std::nullopt;
    if (SHA256_Final(h256.data(), &sha256) != 1) return std::nullopt;
    return FileDigests{digest_to_hex(h1.data(), h1.size()), digest_to_hex(h256.data(), h256.size())};
}

// Single streaming pass over the file; memory stays bounded by chunk_bytes.
// Returns nullopt when the file cannot be opened or read.
inline std::optional<FileDigests> digest_file(const std::filesystem::path& path,
                                              size_t chunk_bytes = kDefaultHashChunkBytes) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    SHA_CTX sha1;
    SHA256_CTX sha256;
    if (SHA1_Init(&sha1) != 1 || SHA256_Init(&sha256) != 1) return std::nullopt;
    std::vector<char> buf(chunk_bytes == 0 ? kDefaultHashChunkBytes : chunk_bytes);
    while (file) {
        file.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize n = file.gcount();
        if (n > 0) {
            if (SHA1_Update(&sha1, buf.data(), static_cast<size_t>(n)) != 1) return std::nullopt;
            if (SHA256_Update(&sha256, buf.data(), static_cast<size_t>(n)) != 1) return std::nullopt;
        }
    }
    if (file.bad()) return std::nullopt;
    std::array<unsigned char, SHA_DIGEST_LENGTH> h1{};
    std::array<unsigned char, SHA256_DIGEST_LENGTH> h256{};
    if (SHA1_Final(h1.data(), &sha1) != 1) return std::nullopt;
    if (SHA256_Final(h256.data(), &sha256) != 1) return std::nullopt;
    return FileDigests{digest_to_hex(h1.data(), h1.size()), digest_to_hex(h256.data(), h256.size())};
}

}  // namespace fakehub
