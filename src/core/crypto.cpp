#include "core/crypto.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <cstdio>
#include <memory>

namespace warden::core::crypto {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

} // namespace

std::vector<uint8_t> random_bytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    if (count == 0) {
        return bytes;
    }
    if (RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        return {};
    }
    return bytes;
}

std::string random_uuid() {
    auto bytes = random_bytes(16);
    if (bytes.size() != 16) {
        return "";
    }
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3f) | 0x80);

    char buf[37];
    std::snprintf(buf, sizeof(buf),
        "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
        bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
        bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return std::string(buf);
}

std::vector<uint8_t> sha256(const std::string& data) {
    std::vector<uint8_t> digest(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &len, EVP_sha256(), nullptr) != 1) {
        return {};
    }
    digest.resize(len);
    return digest;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return "";
    }
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(written < 0 ? 0 : static_cast<size_t>(written));
    return out;
}

std::optional<std::vector<uint8_t>> base64_decode(const std::string& text) {
    if (text.empty()) {
        return std::vector<uint8_t>{};
    }
    if (text.size() % 4 != 0) {
        return std::nullopt;
    }
    std::vector<uint8_t> out(3 * text.size() / 4);
    int written = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (written < 0) {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts padding bytes as output
    size_t padding = 0;
    if (text[text.size() - 1] == '=') padding++;
    if (text[text.size() - 2] == '=') padding++;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

std::string base64url_encode(const std::vector<uint8_t>& data) {
    std::string out = base64_encode(data);
    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    for (auto& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return out;
}

std::vector<uint8_t> pbkdf2_sha256(const std::string& password, const std::vector<uint8_t>& salt,
                                   int iterations, size_t key_size) {
    std::vector<uint8_t> key(key_size);
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          salt.data(), static_cast<int>(salt.size()), iterations,
                          EVP_sha256(), static_cast<int>(key_size), key.data()) != 1) {
        return {};
    }
    return key;
}

bool aes_gcm_encrypt(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv,
                     const std::vector<uint8_t>& plaintext, const std::string& aad,
                     std::vector<uint8_t>& out) {
    if (key.size() != AES_KEY_SIZE || iv.size() != GCM_IV_SIZE) {
        return false;
    }
    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx || EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key.data(), iv.data()) != 1) {
        return false;
    }

    int len = 0;
    if (!aad.empty() &&
        EVP_EncryptUpdate(ctx.get(), nullptr, &len,
                          reinterpret_cast<const unsigned char*>(aad.data()),
                          static_cast<int>(aad.size())) != 1) {
        return false;
    }

    out.assign(plaintext.size() + GCM_TAG_SIZE, 0);
    int written = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), out.data(), &len, plaintext.data(),
                              static_cast<int>(plaintext.size())) != 1) {
            return false;
        }
        written = len;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + written, &len) != 1) {
        return false;
    }
    written += len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(GCM_TAG_SIZE),
                            out.data() + written) != 1) {
        return false;
    }
    out.resize(static_cast<size_t>(written) + GCM_TAG_SIZE);
    return true;
}

bool aes_gcm_decrypt(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv,
                     const std::vector<uint8_t>& ciphertext, const std::string& aad,
                     std::vector<uint8_t>& out) {
    if (key.size() != AES_KEY_SIZE || iv.size() != GCM_IV_SIZE || ciphertext.size() < GCM_TAG_SIZE) {
        return false;
    }
    size_t body_size = ciphertext.size() - GCM_TAG_SIZE;
    std::vector<uint8_t> tag(ciphertext.begin() + static_cast<std::ptrdiff_t>(body_size), ciphertext.end());

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx || EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key.data(), iv.data()) != 1) {
        return false;
    }

    int len = 0;
    if (!aad.empty() &&
        EVP_DecryptUpdate(ctx.get(), nullptr, &len,
                          reinterpret_cast<const unsigned char*>(aad.data()),
                          static_cast<int>(aad.size())) != 1) {
        return false;
    }

    std::vector<uint8_t> plain(body_size + 1, 0);
    int written = 0;
    if (body_size > 0) {
        if (EVP_DecryptUpdate(ctx.get(), plain.data(), &len, ciphertext.data(),
                              static_cast<int>(body_size)) != 1) {
            secure_clear(plain);
            return false;
        }
        written = len;
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(GCM_TAG_SIZE),
                            tag.data()) != 1 ||
        EVP_DecryptFinal_ex(ctx.get(), plain.data() + written, &len) != 1) {
        secure_clear(plain);
        return false;
    }
    written += len;
    plain.resize(static_cast<size_t>(written));
    out = std::move(plain);
    return true;
}

void secure_clear(std::vector<uint8_t>& data) {
    if (!data.empty()) {
        OPENSSL_cleanse(data.data(), data.size());
    }
    data.clear();
}

void secure_clear(std::string& data) {
    if (!data.empty()) {
        OPENSSL_cleanse(&data[0], data.size());
    }
    data.clear();
}

} // namespace warden::core::crypto
