#pragma once

#include <cstddef>
#include <string>

namespace worktrack {

/**
 * @brief HMAC-SHA256 hash chain over the transition event log
 *
 * Each digest covers the previous digest and the canonical event payload,
 * so editing, dropping or reordering any record breaks every later link.
 */
class AuditSigner {
public:
    /// @throws std::invalid_argument if the key does not decode to at least 16 bytes
    explicit AuditSigner(const std::string& keyBase64);
    
    /// @throws std::runtime_error if the HMAC cannot be computed
    std::string sign(const std::string& previousDigest, const std::string& payload) const;
    bool verify(const std::string& previousDigest, const std::string& payload,
                const std::string& digest) const;
    
    static std::string base64Decode(const std::string& encoded);
    static std::string base64Encode(const std::string& data);
    
private:
    static constexpr std::size_t kMinKeyBytes = 16;
    static constexpr unsigned int kDigestBytes = 32;
    
    static std::string hmacSha256(const std::string& key, const std::string& message);
    static bool constantTimeEquals(const std::string& a, const std::string& b);
    
    std::string key_;
};

} // namespace worktrack
