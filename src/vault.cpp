#include "vault.hpp"
#include "errors.hpp"

#include <memory>
#include <algorithm>
#include <boost/beast/core/detail/base64.hpp>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <openssl/crypto.h>

namespace base64 = boost::beast::detail::base64;

namespace chatgate {

namespace {

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

CipherCtx new_cipher_ctx() {
    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) throw VaultError("cipher context allocation failed");
    return ctx;
}

}

std::string encode_base64(const std::string& data) {
    std::string out(base64::encoded_size(data.size()), '\0');
    out.resize(base64::encode(out.data(), data.data(), data.size()));
    return out;
}

// Rejects anything but canonical alphabet characters followed by optional '=' padding.
std::optional<std::string> decode_base64(const std::string& encoded) {
    std::string out(base64::decoded_size(encoded.size()), '\0');
    auto [written, read] = base64::decode(out.data(), encoded.data(), encoded.size());

    bool only_padding = std::all_of(encoded.begin() + read, encoded.end(),
                                    [](char c) { return c == '='; });
    if (!only_padding) return std::nullopt;

    out.resize(written);
    return out;
}

std::string hash_user_id(const std::string& platform, const std::string& user_id) {
    std::string data = platform + ":" + user_id;
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return encode_base64(std::string(reinterpret_cast<const char*>(hash), 8));
}

AesGcmVault::AesGcmVault(const std::string& key_base64) {
    auto key = decode_base64(key_base64);
    if (!key || key->size() != KEY_SIZE) {
        throw VaultError("invalid encryption key");
    }
    std::copy(key->begin(), key->end(), key_.begin());
    OPENSSL_cleanse(key->data(), key->size());
}

std::string AesGcmVault::generate_key() {
    unsigned char key[KEY_SIZE];
    if (RAND_bytes(key, sizeof(key)) != 1) {
        throw VaultError("CSPRNG failure");
    }
    std::string encoded = encode_base64(std::string(reinterpret_cast<const char*>(key), sizeof(key)));
    OPENSSL_cleanse(key, sizeof(key));
    return encoded;
}

std::string AesGcmVault::encrypt(const std::string& plaintext) {
    std::string blob(NONCE_SIZE + plaintext.size() + TAG_SIZE, '\0');
    auto* nonce = reinterpret_cast<unsigned char*>(blob.data());
    auto* body = nonce + NONCE_SIZE;

    if (RAND_bytes(nonce, NONCE_SIZE) != 1) {
        throw VaultError("CSPRNG failure");
    }

    auto ctx = new_cipher_ctx();
    int len = 0;
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, NONCE_SIZE, nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce) != 1) {
        throw VaultError("encrypt init failed");
    }

    if (EVP_EncryptUpdate(ctx.get(), body, &len,
                          reinterpret_cast<const unsigned char*>(plaintext.data()),
                          static_cast<int>(plaintext.size())) != 1) {
        throw VaultError("encrypt failed");
    }
    int total = len;

    if (EVP_EncryptFinal_ex(ctx.get(), body + total, &len) != 1) {
        throw VaultError("encrypt finalize failed");
    }
    total += len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, TAG_SIZE, body + total) != 1) {
        throw VaultError("tag extraction failed");
    }

    blob.resize(NONCE_SIZE + total + TAG_SIZE);
    return encode_base64(blob);
}

std::string AesGcmVault::decrypt(const std::string& ciphertext) {
    auto blob = decode_base64(ciphertext);
    if (!blob || blob->size() < NONCE_SIZE + TAG_SIZE) {
        throw VaultError("decryption failed");
    }

    const auto* nonce = reinterpret_cast<const unsigned char*>(blob->data());
    const auto* body = nonce + NONCE_SIZE;
    const size_t body_len = blob->size() - NONCE_SIZE - TAG_SIZE;
    unsigned char tag[TAG_SIZE];
    std::copy(body + body_len, body + body_len + TAG_SIZE, tag);

    std::string plaintext(body_len, '\0');
    auto* out = reinterpret_cast<unsigned char*>(plaintext.data());

    auto ctx = new_cipher_ctx();
    int len = 0;
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, NONCE_SIZE, nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce) != 1) {
        throw VaultError("decrypt init failed");
    }

    if (EVP_DecryptUpdate(ctx.get(), out, &len, body, static_cast<int>(body_len)) != 1) {
        throw VaultError("decryption failed");
    }
    int total = len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, TAG_SIZE, tag) != 1 ||
        EVP_DecryptFinal_ex(ctx.get(), out + total, &len) != 1) {
        throw VaultError("decryption failed");
    }
    total += len;

    plaintext.resize(total);
    return plaintext;
}

}
