#include <gtest/gtest.h>
#include "vault.hpp"
#include "errors.hpp"

using namespace chatgate;

TEST(VaultTest, RoundTrip) {
    AesGcmVault vault(AesGcmVault::generate_key());
    auto ct = vault.encrypt("hello gateway");
    EXPECT_NE(ct, "hello gateway");
    EXPECT_EQ(vault.decrypt(ct), "hello gateway");
    EXPECT_EQ(vault.decrypt(vault.encrypt("")), "");
}

TEST(VaultTest, NoncesDiffer) {
    AesGcmVault vault(AesGcmVault::generate_key());
    EXPECT_NE(vault.encrypt("same"), vault.encrypt("same"));
}

TEST(VaultTest, TamperingIsDetected) {
    AesGcmVault vault(AesGcmVault::generate_key());
    auto blob = *decode_base64(vault.encrypt("secret"));
    blob[AesGcmVault::NONCE_SIZE] ^= 0x01;
    EXPECT_THROW(vault.decrypt(encode_base64(blob)), VaultError);
}

TEST(VaultTest, WrongKeyFails) {
    AesGcmVault a(AesGcmVault::generate_key());
    AesGcmVault b(AesGcmVault::generate_key());
    EXPECT_THROW(b.decrypt(a.encrypt("secret")), VaultError);
}

TEST(VaultTest, MalformedCiphertext) {
    AesGcmVault vault(AesGcmVault::generate_key());
    EXPECT_THROW(vault.decrypt("not base64 !!"), VaultError);
    EXPECT_THROW(vault.decrypt(encode_base64("short")), VaultError);
}

TEST(VaultTest, RejectsBadKeys) {
    EXPECT_THROW(AesGcmVault("not-a-key!"), VaultError);
    EXPECT_THROW(AesGcmVault(encode_base64(std::string(16, 'k'))), VaultError);
    EXPECT_NO_THROW(AesGcmVault(encode_base64(std::string(32, 'k'))));
}

TEST(VaultTest, HashUserIdIsStable) {
    auto h = hash_user_id("telegram", "12345");
    EXPECT_EQ(h.size(), 12u);
    EXPECT_EQ(h, hash_user_id("telegram", "12345"));
    EXPECT_NE(h, hash_user_id("slack", "12345"));
    EXPECT_EQ(h.find("12345"), std::string::npos);
}

TEST(VaultTest, Base64) {
    EXPECT_EQ(encode_base64("hi"), "aGk=");
    EXPECT_EQ(*decode_base64("aGk="), "hi");
    EXPECT_FALSE(decode_base64("aG$k").has_value());
}
