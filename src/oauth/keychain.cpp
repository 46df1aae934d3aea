#include "oauth/keychain.hpp"
#include "core/crypto.hpp"
#include "core/subprocess.hpp"
#include <spdlog/spdlog.h>

namespace warden::oauth {

namespace {

std::string describe_failure(const core::ProcessOutput& output) {
    if (!output.success) {
        return output.error;
    }
    std::string detail = output.err;
    while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r')) {
        detail.pop_back();
    }
    if (detail.empty()) {
        detail = "exit code " + std::to_string(output.exit_code);
    }
    return detail;
}

} // namespace

KeychainClient::KeychainClient(std::string service, std::string tool)
    : service_(std::move(service)), tool_(std::move(tool)) {}

core::Status KeychainClient::store(const std::string& label, const std::string& secret) {
    auto output = core::run_process(
        {tool_, "store", "--label=" + service_ + ":" + label, "service", service_, "account", label},
        secret);
    if (!output.success || output.exit_code != 0) {
        return core::Status::fail(core::ErrorCode::BACKEND,
            "keychain store failed for '" + label + "': " + describe_failure(output));
    }
    return core::Status::ok();
}

SecretResult KeychainClient::lookup(const std::string& label) {
    auto output = core::run_process({tool_, "lookup", "service", service_, "account", label}, "");
    if (!output.success) {
        return SecretResult::fail(core::ErrorCode::BACKEND,
            "keychain lookup failed for '" + label + "': " + output.error);
    }
    // secret-tool exits 1 with no output when nothing matches
    if (output.exit_code != 0) {
        if (output.err.empty()) {
            return SecretResult::fail(core::ErrorCode::NOT_FOUND, "no secret stored for '" + label + "'");
        }
        return SecretResult::fail(core::ErrorCode::BACKEND,
            "keychain lookup failed for '" + label + "': " + describe_failure(output));
    }

    std::string value = std::move(output.out);
    core::crypto::secure_clear(output.out);
    if (!value.empty() && value.back() == '\n') {
        value.pop_back();
    }
    return SecretResult::found(std::move(value));
}

core::Status KeychainClient::clear(const std::string& label) {
    auto output = core::run_process({tool_, "clear", "service", service_, "account", label}, "");
    if (!output.success) {
        return core::Status::fail(core::ErrorCode::BACKEND,
            "keychain clear failed for '" + label + "': " + output.error);
    }
    // Clearing a missing entry is not an error
    if (output.exit_code != 0 && !output.err.empty()) {
        return core::Status::fail(core::ErrorCode::BACKEND,
            "keychain clear failed for '" + label + "': " + describe_failure(output));
    }
    spdlog::debug("Keychain entry cleared: {}", label);
    return core::Status::ok();
}

} // namespace warden::oauth
