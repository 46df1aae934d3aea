#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/error.hpp"
#include "core/task_pool.hpp"
#include "oauth/consent.hpp"
#include "oauth/http_transport.hpp"
#include "oauth/providers.hpp"
#include "oauth/types.hpp"
#include "oauth/vault.hpp"

namespace warden::oauth {

// Lifecycle of the vault record behind a handle
enum class TokenState {
    PENDING_DEVICE,
    PENDING_PKCE,
    ACTIVE
};

inline const char* token_state_to_string(TokenState state) {
    switch (state) {
        case TokenState::PENDING_DEVICE: return "pending_device";
        case TokenState::PENDING_PKCE:   return "pending_pkce";
        case TokenState::ACTIVE:         return "active";
        default: return "unknown";
    }
}

inline std::optional<TokenState> token_state_from_string(const std::string& str) {
    if (str == "pending_device") return TokenState::PENDING_DEVICE;
    if (str == "pending_pkce") return TokenState::PENDING_PKCE;
    if (str == "active") return TokenState::ACTIVE;
    return std::nullopt;
}

// JSON record stored in the vault under the handle id
struct StoredToken {
    TokenState state = TokenState::PENDING_DEVICE;
    std::optional<std::string> access_token;
    std::optional<std::string> refresh_token;
    std::optional<std::string> token_type;
    std::optional<int64_t> expires_at;      // seconds since epoch
    std::optional<std::string> device_code;
    std::optional<int> interval;            // seconds between device polls
    std::optional<std::string> code_verifier;
    std::optional<std::string> oauth_state;

    nlohmann::json to_json() const;
    static std::optional<StoredToken> from_json(const nlohmann::json& j);
};

// What the user must see to approve a device authorization
struct DeviceAuthorization {
    std::string user_code;
    std::string verification_uri;
    std::optional<std::string> verification_uri_complete;
    int expires_in = 0;
    int interval = 5;
};

struct DeviceFlowResult {
    bool success = false;
    core::ErrorCode code = core::ErrorCode::NONE;
    std::string error;
    TokenHandle handle;
    DeviceAuthorization authorization;
};

struct PkceFlowResult {
    bool success = false;
    core::ErrorCode code = core::ErrorCode::NONE;
    std::string error;
    TokenHandle handle;
    std::string authorization_url;
};

enum class TokenStatus {
    MISSING,
    PENDING,
    ACTIVE,
    UNAVAILABLE   // vault locked or backend failure
};

inline const char* token_status_to_string(TokenStatus status) {
    switch (status) {
        case TokenStatus::MISSING:     return "missing";
        case TokenStatus::PENDING:     return "pending";
        case TokenStatus::ACTIVE:      return "active";
        case TokenStatus::UNAVAILABLE: return "unavailable";
        default: return "unknown";
    }
}

struct BrokerOptions {
    size_t poll_workers = 2;
    // Floor for the provider's polling interval; RFC 8628 intervals are whole seconds
    std::chrono::milliseconds min_poll_interval{1000};
};

// Told about every token revocation after it reached the consent ledger
using RevokeListener = std::function<void(const std::string& agent_id, const std::string& capability)>;

// Runs OAuth flows against registered providers. Secrets go straight into the
// vault; callers only ever receive opaque handles.
class OAuthBroker {
public:
    OAuthBroker(std::shared_ptr<TokenVault> vault,
                std::shared_ptr<ConsentLedger> ledger,
                std::shared_ptr<HttpTransport> transport,
                BrokerOptions options = BrokerOptions());

    OAuthBroker(const OAuthBroker&) = delete;
    OAuthBroker& operator=(const OAuthBroker&) = delete;

    void register_provider(const std::string& name, ProviderConfig config);
    std::optional<ProviderConfig> get_provider(const std::string& name) const;
    std::vector<std::string> provider_names() const;

    void set_revoke_listener(RevokeListener listener);

    // Device authorization grant (RFC 8628). Blocks only for the device
    // authorization request; token polling continues in the background.
    DeviceFlowResult request_token_device_code(const std::string& provider,
                                               const std::vector<std::string>& scopes);

    // Authorization code grant with PKCE (RFC 7636, S256). Returns the URL the
    // user must open; finish with complete_pkce once the redirect arrives.
    PkceFlowResult request_token_pkce(const std::string& provider,
                                      const std::vector<std::string>& scopes);
    core::Status complete_pkce(const TokenHandle& handle, const std::string& code,
                               const std::string& state);

    // Refresh-token grant, updating the vault record in place
    core::Status refresh(const TokenHandle& handle);

    // Revoke at the provider when supported, drop the vault record and record
    // the revocation in the consent ledger as "oauth.<provider>"
    core::Status revoke(const TokenHandle& handle, const std::string& agent_id);

    TokenStatus status(const TokenHandle& handle);

    // Send a request on an agent's behalf with the handle's bearer token
    HttpResponse send_authorized(const TokenHandle& handle, HttpRequest request);

    // Block until every device flow has finished polling
    void wait_idle();

private:
    struct RecordResult {
        bool success = false;
        core::ErrorCode code = core::ErrorCode::NONE;
        std::string error;
        StoredToken record;
    };

    // Sole path from a handle to its secret
    SecretResult get_token(const TokenHandle& handle);

    RecordResult load_record(const std::string& handle_id);
    core::Status save_record(const std::string& handle_id, const StoredToken& record);

    // Write the record only if the handle still exists in the expected state.
    // Guards against a revoke racing an in-flight token exchange.
    core::Status commit_record(const std::string& handle_id, TokenState expected,
                               const StoredToken& record);

    std::optional<ProviderConfig> provider_for(const TokenHandle& handle,
                                               core::Status& error) const;

    struct DevicePoll {
        TokenHandle handle;
        ProviderConfig config;
        std::string device_code;
        int interval = 0;
        std::chrono::system_clock::time_point deadline;
    };

    // One token endpoint poll; reschedules itself while authorization is pending
    void poll_device_token(DevicePoll poll);
    bool schedule_poll(DevicePoll poll);

    void drop_pending(const std::string& handle_id);

    std::shared_ptr<TokenVault> vault_;
    std::shared_ptr<ConsentLedger> ledger_;
    std::shared_ptr<HttpTransport> transport_;
    BrokerOptions options_;

    std::map<std::string, ProviderConfig> providers_;
    mutable std::shared_mutex providers_mutex_;

    RevokeListener revoke_listener_;
    std::mutex listener_mutex_;

    // Serializes check-and-write of vault records against revoke
    std::mutex records_mutex_;

    core::TaskPool poll_pool_;
};

} // namespace warden::oauth
