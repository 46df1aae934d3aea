#include "oauth/providers.hpp"

namespace warden::oauth {

ProviderConfig github_provider(const std::string& client_id) {
    ProviderConfig config;
    config.client_id = client_id;
    config.auth_url = "https://github.com/login/oauth/authorize";
    config.token_url = "https://github.com/login/oauth/access_token";
    config.device_auth_url = "https://github.com/login/device/code";
    // GitHub token revocation needs the client secret; tokens are only dropped locally
    config.revocation_url = std::nullopt;
    config.scopes = {"repo", "read:user"};
    return config;
}

ProviderConfig google_provider(const std::string& client_id) {
    ProviderConfig config;
    config.client_id = client_id;
    config.auth_url = "https://accounts.google.com/o/oauth2/v2/auth";
    config.token_url = "https://oauth2.googleapis.com/token";
    config.device_auth_url = "https://oauth2.googleapis.com/device/code";
    config.revocation_url = "https://oauth2.googleapis.com/revoke";
    config.scopes = {"openid", "email"};
    return config;
}

} // namespace warden::oauth
