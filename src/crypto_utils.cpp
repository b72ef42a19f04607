#include "crypto_utils.h"
#include <openssl/sha.h>
#include <openssl/evp.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/rand.h>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace scriptbox {

std::string CryptoUtils::bytes_to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string CryptoUtils::sha256_string(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return bytes_to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::string CryptoUtils::fingerprint(const std::string& data, size_t length) {
    return sha256_string(data).substr(0, length);
}

std::string CryptoUtils::base64_encode(const std::string& data) {
    if (data.empty()) {
        return "";
    }

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bio = BIO_new(BIO_s_mem());
    if (!b64 || !bio) {
        BIO_free(b64);
        BIO_free(bio);
        throw std::runtime_error("Failed to allocate base64 encoder");
    }
    bio = BIO_push(b64, bio);

    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);
    if (BIO_write(bio, data.data(), static_cast<int>(data.size())) <= 0 ||
        BIO_flush(bio) != 1) {
        BIO_free_all(bio);
        throw std::runtime_error("Failed to base64 encode data");
    }

    BUF_MEM* bufferPtr;
    BIO_get_mem_ptr(bio, &bufferPtr);

    std::string result(bufferPtr->data, bufferPtr->length);
    BIO_free_all(bio);

    return result;
}

std::string CryptoUtils::random_hex(size_t num_bytes) {
    std::vector<unsigned char> buffer(num_bytes);
    if (num_bytes > 0 && RAND_bytes(buffer.data(), static_cast<int>(num_bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return bytes_to_hex(buffer.data(), buffer.size());
}

} // namespace scriptbox
