#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

// Forward declaration (OpenSSL EVP_MD_CTX)
struct evp_md_ctx_st;

namespace objxfer {

/// Incremental MD5 (hex output), used for local ETags and download verification.
class Md5Hasher {
public:
    Md5Hasher();
    ~Md5Hasher();

    Md5Hasher(const Md5Hasher&) = delete;
    Md5Hasher& operator=(const Md5Hasher&) = delete;

    void update(const void* data, size_t len);
    std::string hex_digest();

private:
    evp_md_ctx_st* ctx_;
};

std::string md5_hex(std::string_view data);

/// MD5 of a file's content. Empty optional if the file cannot be read.
std::optional<std::string> file_md5_hex(const std::filesystem::path& path);

std::string hmac_sha256_hex(std::string_view key, std::string_view message);

/// `bytes` random bytes from the OpenSSL CSPRNG, hex encoded.
std::string random_hex(size_t bytes);

/// True if an ETag looks like a plain MD5 (single-part upload).
bool is_md5_etag(std::string_view etag);

}  // namespace objxfer
