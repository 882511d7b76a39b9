/**
 * @file AuditSigner.cpp
 * @brief HMAC-SHA256 audit chain for persisted transition events
 *
 * Uses OpenSSL for the HMAC computation and its BIO interface for Base64.
 * Digests are stored Base64-encoded next to each event.
 */

#include "AuditSigner.hpp"
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <stdexcept>

namespace worktrack {

AuditSigner::AuditSigner(const std::string& keyBase64)
    : key_(base64Decode(keyBase64)) {
    if (key_.size() < kMinKeyBytes) {
        throw std::invalid_argument("audit key must decode to at least 16 bytes");
    }
}

/**
 * @brief Compute the next link of the chain
 * @param previousDigest Digest of the preceding event, empty for the first one
 * @param payload Canonical event payload
 * @return Base64-encoded HMAC-SHA256 over previousDigest, a newline and payload
 */
std::string AuditSigner::sign(const std::string& previousDigest, const std::string& payload) const {
    return base64Encode(hmacSha256(key_, previousDigest + "\n" + payload));
}

bool AuditSigner::verify(const std::string& previousDigest, const std::string& payload,
                         const std::string& digest) const {
    return constantTimeEquals(sign(previousDigest, payload), digest);
}

/**
 * @brief Compute HMAC-SHA256 signature using OpenSSL
 * @return Raw binary digest (32 bytes)
 * @throws std::runtime_error if OpenSSL cannot produce the digest
 */
std::string AuditSigner::hmacSha256(const std::string& key, const std::string& message) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;
    
    unsigned char* result = HMAC(EVP_sha256(),
                                 key.data(), static_cast<int>(key.length()),
                                 reinterpret_cast<const unsigned char*>(message.data()),
                                 message.length(),
                                 digest, &digestLength);
    if (result == nullptr || digestLength != kDigestBytes) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }
    
    return std::string(reinterpret_cast<char*>(digest), digestLength);
}

bool AuditSigner::constantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

/**
 * @brief Encode binary data to Base64 format
 * @note Uses BIO_FLAGS_BASE64_NO_NL to exclude newlines
 */
std::string AuditSigner::base64Encode(const std::string& data) {
    BIO* bio = BIO_new(BIO_s_mem());
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_push(b64, bio);
    
    BIO_write(bio, data.data(), static_cast<int>(data.length()));
    BIO_flush(bio);
    
    BUF_MEM* bufferPtr = nullptr;
    BIO_get_mem_ptr(bio, &bufferPtr);
    
    std::string result(bufferPtr->data, bufferPtr->length);
    BIO_free_all(bio);
    
    return result;
}

/**
 * @brief Decode Base64 string to binary data
 * @return Decoded bytes, or an empty string on decode failure
 */
std::string AuditSigner::base64Decode(const std::string& encoded) {
    if (encoded.empty()) {
        return std::string();
    }
    
    BIO* bio = BIO_new_mem_buf(encoded.data(), static_cast<int>(encoded.length()));
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_push(b64, bio);
    
    std::string result(encoded.length(), 0);
    int decodedLength = BIO_read(bio, &result[0], static_cast<int>(result.size()));
    
    BIO_free_all(bio);
    
    if (decodedLength > 0) {
        result.resize(decodedLength);
    } else {
        result.clear();
    }
    
    return result;
}

} // namespace worktrack
