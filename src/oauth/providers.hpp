#pragma once
#include <optional>
#include <string>
#include <vector>

namespace warden::oauth {

struct ProviderConfig {
    std::string client_id;
    std::string auth_url;
    std::string token_url;
    std::optional<std::string> device_auth_url;
    std::optional<std::string> revocation_url;
    std::string redirect_uri = "http://127.0.0.1:8765/callback";
    std::vector<std::string> scopes;
};

ProviderConfig github_provider(const std::string& client_id);
ProviderConfig google_provider(const std::string& client_id);

} // namespace warden::oauth
