#pragma once
#include <string>

namespace warden::core {

// Error taxonomy shared by every control plane component
enum class ErrorCode {
    NONE,
    FORMAT,       // Malformed capability string
    VALIDATION,   // Manifest schema mismatch, missing entry point, bad OAuth state
    NOT_FOUND,    // Unknown agent/provider/token/revoke target
    LOCKED,       // Vault operation while locked
    BACKEND,      // Keychain/storage failure
    NETWORK       // OAuth HTTP exchange failure
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:       return "NONE";
        case ErrorCode::FORMAT:     return "FORMAT";
        case ErrorCode::VALIDATION: return "VALIDATION";
        case ErrorCode::NOT_FOUND:  return "NOT_FOUND";
        case ErrorCode::LOCKED:     return "LOCKED";
        case ErrorCode::BACKEND:    return "BACKEND";
        case ErrorCode::NETWORK:    return "NETWORK";
        default: return "UNKNOWN";
    }
}

// Outcome of an operation that produces no value
struct Status {
    bool success = true;
    ErrorCode code = ErrorCode::NONE;
    std::string error;

    static Status ok() { return Status{}; }

    static Status fail(ErrorCode code, std::string message) {
        Status status;
        status.success = false;
        status.code = code;
        status.error = std::move(message);
        return status;
    }
};

} // namespace warden::core
