#include "mdwf/digest.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include <openssl/evp.h>

namespace mdwf {

namespace {

// RAII wrapper for EVP_MD_CTX
class DigestContext {
public:
    DigestContext() : ctx_(EVP_MD_CTX_new()) {}
    ~DigestContext() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    DigestContext(const DigestContext&) = delete;
    DigestContext& operator=(const DigestContext&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

    bool init(std::string& error) {
        if (!ctx_) {
            error = "EVP_MD_CTX_new failed";
            return false;
        }
        if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
            error = "EVP_DigestInit_ex failed";
            return false;
        }
        return true;
    }

    bool update(const void* data, size_t len, std::string& error) {
        if (EVP_DigestUpdate(ctx_, data, len) != 1) {
            error = "EVP_DigestUpdate failed";
            return false;
        }
        return true;
    }

    bool finish(std::string& hex, std::string& error) {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hash_len = 0;
        if (EVP_DigestFinal_ex(ctx_, hash, &hash_len) != 1) {
            error = "EVP_DigestFinal_ex failed";
            return false;
        }
        static const char hex_chars[] = "0123456789abcdef";
        hex.clear();
        hex.reserve(hash_len * 2);
        for (unsigned int i = 0; i < hash_len; ++i) {
            hex.push_back(hex_chars[(hash[i] >> 4) & 0x0F]);
            hex.push_back(hex_chars[hash[i] & 0x0F]);
        }
        return true;
    }

private:
    EVP_MD_CTX* ctx_;
};

} // namespace

DigestResult sha256_bytes(const Bytes& data) {
    DigestResult result;
    DigestContext ctx;
    if (!ctx.init(result.error)) return result;
    if (!ctx.update(data.data(), data.size(), result.error)) return result;
    if (!ctx.finish(result.hex_digest, result.error)) return result;
    result.ok = true;
    return result;
}

DigestResult sha256_file(const std::string& file_path) {
    DigestResult result;

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        result.error = "failed to open file: " + file_path;
        return result;
    }

    DigestContext ctx;
    if (!ctx.init(result.error)) return result;

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (!ctx.update(buffer, static_cast<size_t>(file.gcount()), result.error)) {
            return result;
        }
    }

    if (!ctx.finish(result.hex_digest, result.error)) return result;
    result.ok = true;
    return result;
}

bool is_sha256_hex(const std::string& text) {
    if (text.size() != 64) return false;
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

DigestMatch match_sha256(const Bytes& data, const std::string& expected_hex) {
    DigestMatch result;
    result.expected = expected_hex;
    std::transform(result.expected.begin(), result.expected.end(), result.expected.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto digest = sha256_bytes(data);
    if (!digest.ok) {
        result.error = digest.error;
        return result;
    }
    result.actual = digest.hex_digest;

    if (result.actual != result.expected) {
        result.error = "SHA-256 mismatch: expected " + result.expected + ", got " + result.actual;
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace mdwf
