#include <gtest/gtest.h>
#include "../crypto/AuditSigner.hpp"
#include <stdexcept>

using namespace worktrack;

namespace {

std::string testKey() {
    return AuditSigner::base64Encode(std::string(32, 'k'));
}

} // namespace

TEST(AuditSignerTest, Base64KnownValues) {
    EXPECT_EQ(AuditSigner::base64Encode("sure."), "c3VyZS4=");
    EXPECT_EQ(AuditSigner::base64Decode("c3VyZS4="), "sure.");
    EXPECT_EQ(AuditSigner::base64Decode(""), "");
}

TEST(AuditSignerTest, Base64HandlesBinary) {
    std::string binary("\x00\xff\x10\x80", 4);
    EXPECT_EQ(AuditSigner::base64Decode(AuditSigner::base64Encode(binary)), binary);
}

TEST(AuditSignerTest, RejectsShortKey) {
    EXPECT_THROW(AuditSigner(AuditSigner::base64Encode("too-short")), std::invalid_argument);
    EXPECT_THROW(AuditSigner(""), std::invalid_argument);
}

TEST(AuditSignerTest, DigestIsBase64Sha256) {
    AuditSigner signer(testKey());
    auto digest = signer.sign("", "{\"id\":\"e-1\"}");

    EXPECT_EQ(digest.size(), 44u);
    EXPECT_EQ(AuditSigner::base64Decode(digest).size(), 32u);
    EXPECT_EQ(signer.sign("", "{\"id\":\"e-1\"}"), digest);
}

TEST(AuditSignerTest, DigestMatchesReferenceHmac) {
    // Key of twenty 0x0b bytes; the signed message is "\nHi There"
    AuditSigner signer("CwsLCwsLCwsLCwsLCwsLCws=");

    EXPECT_EQ(signer.sign("", "Hi There"), "eR7QKlk0i1bbE7AiX1DFFpUF0VG/XyvaD4c/NHG61sc=");
    EXPECT_EQ(signer.sign("", ""), "VCQi5tMYeizpF8l5ZjotvIj2KNT2EeJ+ww5iG1JtN5I=");
    EXPECT_TRUE(signer.verify("", "Hi There", "eR7QKlk0i1bbE7AiX1DFFpUF0VG/XyvaD4c/NHG61sc="));
    EXPECT_FALSE(signer.verify("", "Hi There", ""));
}

TEST(AuditSignerTest, DigestChainsOnPreviousDigest) {
    AuditSigner signer(testKey());
    auto first = signer.sign("", "payload-1");
    auto second = signer.sign(first, "payload-2");

    EXPECT_NE(second, signer.sign("", "payload-2"));
    EXPECT_TRUE(signer.verify(first, "payload-2", second));
    EXPECT_FALSE(signer.verify(first, "payload-2 edited", second));
    EXPECT_FALSE(signer.verify("", "payload-2", second));
}

TEST(AuditSignerTest, DifferentKeysDisagree) {
    AuditSigner a(testKey());
    AuditSigner b(AuditSigner::base64Encode(std::string(32, 'q')));

    auto digest = a.sign("", "payload");
    EXPECT_FALSE(b.verify("", "payload", digest));
}
