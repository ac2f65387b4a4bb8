#include "objxfer/checksum.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <array>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace objxfer {

namespace {

std::string to_hex(const unsigned char* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

}  // namespace

// --- Md5Hasher ---

Md5Hasher::Md5Hasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("EVP md5 init failed");
    }
}

Md5Hasher::~Md5Hasher() {
    EVP_MD_CTX_free(ctx_);
}

void Md5Hasher::update(const void* data, size_t len) {
    EVP_DigestUpdate(ctx_, data, len);
}

std::string Md5Hasher::hex_digest() {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int len = 0;
    EVP_DigestFinal_ex(ctx_, digest.data(), &len);
    return to_hex(digest.data(), len);
}

// --- Free helpers ---

std::string md5_hex(std::string_view data) {
    Md5Hasher hasher;
    hasher.update(data.data(), data.size());
    return hasher.hex_digest();
}

std::optional<std::string> file_md5_hex(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;

    Md5Hasher hasher;
    std::vector<char> buf(64 * 1024);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto n = in.gcount();
        if (n > 0) hasher.update(buf.data(), static_cast<size_t>(n));
    }
    if (in.bad()) return std::nullopt;
    return hasher.hex_digest();
}

std::string hmac_sha256_hex(std::string_view key, std::string_view message) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(message.data()), message.size(),
         out, &out_len);
    return to_hex(out, out_len);
}

std::string random_hex(size_t bytes) {
    std::vector<unsigned char> buf(bytes);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return to_hex(buf.data(), buf.size());
}

bool is_md5_etag(std::string_view etag) {
    if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
        etag = etag.substr(1, etag.size() - 2);
    }
    if (etag.size() != 32) return false;
    for (char c : etag) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

}  // namespace objxfer
