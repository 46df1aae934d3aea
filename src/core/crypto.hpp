#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace warden::core::crypto {

// Cryptographically secure random bytes (OpenSSL RAND_bytes). Empty on failure.
std::vector<uint8_t> random_bytes(size_t count);

// Random RFC 4122 version 4 identifier, e.g. "3f2b8c1e-...". Empty on failure.
std::string random_uuid();

// SHA-256 digest
std::vector<uint8_t> sha256(const std::string& data);

// Standard base64 with padding
std::string base64_encode(const std::vector<uint8_t>& data);
std::optional<std::vector<uint8_t>> base64_decode(const std::string& text);

// URL-safe base64 without padding (RFC 4648 §5), as used by PKCE
std::string base64url_encode(const std::vector<uint8_t>& data);

inline constexpr size_t AES_KEY_SIZE = 32;
inline constexpr size_t GCM_IV_SIZE = 12;
inline constexpr size_t GCM_TAG_SIZE = 16;

// PBKDF2-HMAC-SHA256 key derivation. Empty on failure.
std::vector<uint8_t> pbkdf2_sha256(const std::string& password, const std::vector<uint8_t>& salt,
                                   int iterations, size_t key_size = AES_KEY_SIZE);

// AES-256-GCM. The tag is appended to the ciphertext; the same AAD must be
// supplied to decrypt. Both return false on failure (wrong key, tampering).
bool aes_gcm_encrypt(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv,
                     const std::vector<uint8_t>& plaintext, const std::string& aad,
                     std::vector<uint8_t>& out);
bool aes_gcm_decrypt(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv,
                     const std::vector<uint8_t>& ciphertext, const std::string& aad,
                     std::vector<uint8_t>& out);

// Overwrite sensitive memory before release
void secure_clear(std::vector<uint8_t>& data);
void secure_clear(std::string& data);

} // namespace warden::core::crypto
