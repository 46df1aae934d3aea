#pragma once
#include <string>
#include <vector>
#include "core/error.hpp"

namespace warden::oauth {

// Outcome of reading a secret from a vault backend
struct SecretResult {
    bool success = false;
    core::ErrorCode code = core::ErrorCode::NONE;
    std::string error;
    std::string value;

    static SecretResult fail(core::ErrorCode code, std::string message) {
        SecretResult result;
        result.code = code;
        result.error = std::move(message);
        return result;
    }

    static SecretResult found(std::string value) {
        SecretResult result;
        result.success = true;
        result.value = std::move(value);
        return result;
    }
};

// Opaque reference to a token held in the vault. Never carries the secret.
struct TokenHandle {
    std::string id;
    std::string provider;
    std::vector<std::string> scopes;
};

} // namespace warden::oauth
