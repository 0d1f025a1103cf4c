#pragma once

#include "mdwf/types.hpp"

#include <string>

namespace mdwf {

// ============================================================================
// SHA-256 (OpenSSL EVP)
// ============================================================================
//
// Used to pin an archive to a known digest and to report archive identity.

struct DigestResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;  // lowercase, 64 chars
};

DigestResult sha256_bytes(const Bytes& data);
DigestResult sha256_file(const std::string& file_path);

// 64 hex digits, either case
bool is_sha256_hex(const std::string& text);

struct DigestMatch {
    bool ok = false;
    std::string error;
    std::string actual;
    std::string expected;  // lower-cased
};

DigestMatch match_sha256(const Bytes& data, const std::string& expected_hex);

} // namespace mdwf
