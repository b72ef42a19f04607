#pragma once

#include <string>
#include <vector>

namespace scriptbox {

// Thin OpenSSL wrappers used for harness generation and audit logging
class CryptoUtils {
public:
    // Hex SHA256 of arbitrary data
    static std::string sha256_string(const std::string& data);

    // Short fingerprint (hex prefix of the SHA256) for log lines
    static std::string fingerprint(const std::string& data, size_t length = 12);

    // Base64 without line breaks, safe to embed in a single-line literal
    static std::string base64_encode(const std::string& data);

    // Cryptographically random hex string of 2 * num_bytes characters.
    // Throws std::runtime_error if the RNG is unavailable.
    static std::string random_hex(size_t num_bytes);

    static std::string bytes_to_hex(const unsigned char* data, size_t len);
};

} // namespace scriptbox
