#pragma once
#include <string>
#include "core/error.hpp"
#include "oauth/types.hpp"

namespace warden::oauth {

// OS keychain access through the freedesktop Secret Service CLI.
// Entries are keyed by the attributes (service, account=<label>).
class KeychainClient {
public:
    explicit KeychainClient(std::string service = "warden", std::string tool = "secret-tool");

    core::Status store(const std::string& label, const std::string& secret);
    SecretResult lookup(const std::string& label);
    core::Status clear(const std::string& label);

    const std::string& service() const { return service_; }

private:
    std::string service_;
    std::string tool_;
};

} // namespace warden::oauth
