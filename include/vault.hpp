#pragma once

#include <string>
#include <array>
#include <optional>

namespace chatgate {

// Authenticated symmetric encryption boundary for message bodies at rest.
// Both operations throw VaultError on failure.
class Vault {
public:
    virtual ~Vault() = default;
    virtual std::string encrypt(const std::string& plaintext) = 0;
    virtual std::string decrypt(const std::string& ciphertext) = 0;
};

// AES-256-GCM via OpenSSL. Ciphertext layout: base64(nonce[12] || data || tag[16]).
class AesGcmVault : public Vault {
public:
    static constexpr size_t KEY_SIZE = 32;
    static constexpr size_t NONCE_SIZE = 12;
    static constexpr size_t TAG_SIZE = 16;

    // Key is base64 of exactly 32 bytes.
    explicit AesGcmVault(const std::string& key_base64);

    std::string encrypt(const std::string& plaintext) override;
    std::string decrypt(const std::string& ciphertext) override;

    // Fresh random key, base64 encoded.
    static std::string generate_key();

private:
    std::array<unsigned char, KEY_SIZE> key_;
};

// Loggable form of a platform user: base64 of the first 8 bytes of SHA-256("platform:user").
std::string hash_user_id(const std::string& platform, const std::string& user_id);

std::string encode_base64(const std::string& data);
std::optional<std::string> decode_base64(const std::string& encoded);

}
