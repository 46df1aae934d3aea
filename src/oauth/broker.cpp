#include "oauth/broker.hpp"
#include "core/crypto.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

using json = nlohmann::json;

namespace warden::oauth {

namespace crypto = core::crypto;

namespace {

constexpr const char* DEVICE_GRANT_TYPE = "urn:ietf:params:oauth:grant-type:device_code";
constexpr int DEFAULT_POLL_INTERVAL = 5;
constexpr int SLOW_DOWN_INCREMENT = 5;

int64_t now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string join_scopes(const std::vector<std::string>& scopes) {
    std::string joined;
    for (const auto& scope : scopes) {
        if (!joined.empty()) joined += ' ';
        joined += scope;
    }
    return joined;
}

std::string describe_http_failure(const HttpResponse& response) {
    if (!response.success) {
        return response.error;
    }
    std::string message = "HTTP " + std::to_string(response.status);
    json j = json::parse(response.body, nullptr, false);
    if (!j.is_discarded() && j.is_object()) {
        if (j.contains("error_description") && j["error_description"].is_string()) {
            message += ": " + j["error_description"].get<std::string>();
        } else if (j.contains("error") && j["error"].is_string()) {
            message += ": " + j["error"].get<std::string>();
        }
    }
    return message;
}

bool is_http_ok(const HttpResponse& response) {
    return response.success && response.status >= 200 && response.status < 300;
}

// Copy the token fields of a token endpoint response into an active record
bool apply_token_response(const json& j, StoredToken& record, std::string& error) {
    if (!j.is_object() || !j.contains("access_token") || !j["access_token"].is_string()) {
        error = "token response has no access_token";
        return false;
    }
    record.state = TokenState::ACTIVE;
    record.access_token = j["access_token"].get<std::string>();
    if (j.contains("refresh_token") && j["refresh_token"].is_string()) {
        record.refresh_token = j["refresh_token"].get<std::string>();
    }
    record.token_type = j.contains("token_type") && j["token_type"].is_string()
        ? j["token_type"].get<std::string>()
        : std::string("Bearer");
    if (j.contains("expires_in") && j["expires_in"].is_number()) {
        record.expires_at = now_seconds() + j["expires_in"].get<int64_t>();
    } else {
        record.expires_at.reset();
    }
    record.device_code.reset();
    record.interval.reset();
    record.code_verifier.reset();
    record.oauth_state.reset();
    return true;
}

template <typename T>
void put_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

template <typename T>
void get_optional(const json& j, const char* key, std::optional<T>& value) {
    if (j.contains(key) && !j[key].is_null()) {
        value = j[key].get<T>();
    }
}

} // namespace

json StoredToken::to_json() const {
    json j;
    j["state"] = token_state_to_string(state);
    put_optional(j, "access_token", access_token);
    put_optional(j, "refresh_token", refresh_token);
    put_optional(j, "token_type", token_type);
    put_optional(j, "expires_at", expires_at);
    put_optional(j, "device_code", device_code);
    put_optional(j, "interval", interval);
    put_optional(j, "code_verifier", code_verifier);
    put_optional(j, "oauth_state", oauth_state);
    return j;
}

std::optional<StoredToken> StoredToken::from_json(const json& j) {
    try {
        auto state = token_state_from_string(j.at("state").get<std::string>());
        if (!state) {
            return std::nullopt;
        }
        StoredToken record;
        record.state = *state;
        get_optional(j, "access_token", record.access_token);
        get_optional(j, "refresh_token", record.refresh_token);
        get_optional(j, "token_type", record.token_type);
        get_optional(j, "expires_at", record.expires_at);
        get_optional(j, "device_code", record.device_code);
        get_optional(j, "interval", record.interval);
        get_optional(j, "code_verifier", record.code_verifier);
        get_optional(j, "oauth_state", record.oauth_state);
        return record;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

OAuthBroker::OAuthBroker(std::shared_ptr<TokenVault> vault,
                         std::shared_ptr<ConsentLedger> ledger,
                         std::shared_ptr<HttpTransport> transport,
                         BrokerOptions options)
    : vault_(std::move(vault))
    , ledger_(std::move(ledger))
    , transport_(std::move(transport))
    , options_(options)
    , poll_pool_(options.poll_workers) {}

void OAuthBroker::register_provider(const std::string& name, ProviderConfig config) {
    std::unique_lock<std::shared_mutex> lock(providers_mutex_);
    providers_[name] = std::move(config);
    spdlog::info("OAuth provider registered: {}", name);
}

std::optional<ProviderConfig> OAuthBroker::get_provider(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(providers_mutex_);
    auto it = providers_.find(name);
    if (it == providers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> OAuthBroker::provider_names() const {
    std::shared_lock<std::shared_mutex> lock(providers_mutex_);
    std::vector<std::string> names;
    for (const auto& [name, config] : providers_) {
        names.push_back(name);
    }
    return names;
}

std::optional<ProviderConfig> OAuthBroker::provider_for(const TokenHandle& handle,
                                                        core::Status& error) const {
    auto config = get_provider(handle.provider);
    if (!config) {
        error = core::Status::fail(core::ErrorCode::NOT_FOUND,
                                   "OAuth provider not registered: " + handle.provider);
    }
    return config;
}

void OAuthBroker::set_revoke_listener(RevokeListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    revoke_listener_ = std::move(listener);
}

OAuthBroker::RecordResult OAuthBroker::load_record(const std::string& handle_id) {
    RecordResult result;
    auto secret = vault_->fetch(handle_id);
    if (!secret.success) {
        result.code = secret.code;
        result.error = secret.error;
        return result;
    }

    json j = json::parse(secret.value, nullptr, false);
    crypto::secure_clear(secret.value);
    auto record = j.is_discarded() ? std::nullopt : StoredToken::from_json(j);
    if (!record) {
        result.code = core::ErrorCode::BACKEND;
        result.error = "token record for handle " + handle_id + " is corrupted";
        return result;
    }
    result.success = true;
    result.record = std::move(*record);
    return result;
}

core::Status OAuthBroker::save_record(const std::string& handle_id, const StoredToken& record) {
    std::string serialized = record.to_json().dump();
    auto status = vault_->store(handle_id, serialized);
    crypto::secure_clear(serialized);
    return status;
}

core::Status OAuthBroker::commit_record(const std::string& handle_id, TokenState expected,
                                        const StoredToken& record) {
    std::lock_guard<std::mutex> lock(records_mutex_);
    auto current = load_record(handle_id);
    if (!current.success) {
        return core::Status::fail(current.code, current.error);
    }
    if (current.record.state != expected) {
        return core::Status::fail(core::ErrorCode::VALIDATION,
            "handle " + handle_id + " is no longer " + token_state_to_string(expected));
    }
    return save_record(handle_id, record);
}

DeviceFlowResult OAuthBroker::request_token_device_code(const std::string& provider,
                                                        const std::vector<std::string>& scopes) {
    DeviceFlowResult result;

    auto config = get_provider(provider);
    if (!config) {
        result.code = core::ErrorCode::NOT_FOUND;
        result.error = "OAuth provider not registered: " + provider;
        return result;
    }
    if (!config->device_auth_url) {
        result.code = core::ErrorCode::VALIDATION;
        result.error = "provider " + provider + " does not support device authorization";
        return result;
    }

    spdlog::info("Starting device code flow for provider: {}", provider);
    auto response = transport_->post_form(*config->device_auth_url, {
        {"client_id", config->client_id},
        {"scope", join_scopes(scopes)},
    });
    if (!is_http_ok(response)) {
        result.code = core::ErrorCode::NETWORK;
        result.error = "device authorization request failed: " + describe_http_failure(response);
        spdlog::error("{}", result.error);
        return result;
    }

    json j = json::parse(response.body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("device_code") || !j.contains("user_code")) {
        result.code = core::ErrorCode::NETWORK;
        result.error = "malformed device authorization response";
        return result;
    }

    std::string device_code;
    try {
        device_code = j["device_code"].get<std::string>();
        result.authorization.user_code = j["user_code"].get<std::string>();
        // Google names the field verification_url
        result.authorization.verification_uri = j.contains("verification_uri")
            ? j["verification_uri"].get<std::string>()
            : j.value("verification_url", std::string());
        if (j.contains("verification_uri_complete")) {
            result.authorization.verification_uri_complete = j["verification_uri_complete"].get<std::string>();
        }
        result.authorization.expires_in = j.value("expires_in", 900);
        result.authorization.interval = j.value("interval", DEFAULT_POLL_INTERVAL);
    } catch (const json::exception& e) {
        result.code = core::ErrorCode::NETWORK;
        result.error = std::string("malformed device authorization response: ") + e.what();
        return result;
    }

    result.handle.id = crypto::random_uuid();
    result.handle.provider = provider;
    result.handle.scopes = scopes;
    if (result.handle.id.empty()) {
        result.code = core::ErrorCode::BACKEND;
        result.error = "failed to generate token handle";
        return result;
    }

    StoredToken pending;
    pending.state = TokenState::PENDING_DEVICE;
    pending.device_code = device_code;
    pending.interval = result.authorization.interval;
    pending.expires_at = now_seconds() + result.authorization.expires_in;
    auto stored = save_record(result.handle.id, pending);
    if (!stored.success) {
        result.code = stored.code;
        result.error = stored.error;
        return result;
    }

    DevicePoll poll;
    poll.handle = result.handle;
    poll.config = *config;
    poll.device_code = device_code;
    poll.interval = result.authorization.interval;
    poll.deadline = std::chrono::system_clock::now() + std::chrono::seconds(result.authorization.expires_in);
    if (!schedule_poll(std::move(poll))) {
        drop_pending(result.handle.id);
        result.code = core::ErrorCode::BACKEND;
        result.error = "broker is shutting down";
        return result;
    }

    spdlog::info("Device code issued for {}: enter {} at {}", provider,
                 result.authorization.user_code, result.authorization.verification_uri);
    result.success = true;
    return result;
}

void OAuthBroker::drop_pending(const std::string& handle_id) {
    std::lock_guard<std::mutex> lock(records_mutex_);
    auto erased = vault_->erase(handle_id);
    if (!erased.success) {
        spdlog::error("Failed to drop pending record {}: {}", handle_id, erased.error);
    }
}

bool OAuthBroker::schedule_poll(DevicePoll poll) {
    auto delay = std::max<std::chrono::milliseconds>(std::chrono::seconds(poll.interval),
                                                     options_.min_poll_interval);
    return poll_pool_.submit_after(delay, [this, poll]() { poll_device_token(poll); });
}

void OAuthBroker::poll_device_token(DevicePoll poll) {
    const TokenHandle& handle = poll.handle;
    auto reschedule = [this, &poll]() {
        if (!schedule_poll(poll)) {
            spdlog::debug("Device flow for handle {} abandoned: broker shutting down", poll.handle.id);
        }
    };

    if (std::chrono::system_clock::now() > poll.deadline) {
        spdlog::warn("Device code for handle {} expired before approval", handle.id);
        drop_pending(handle.id);
        return;
    }

    // A revoke while waiting removes the pending record
    auto current = load_record(handle.id);
    if (!current.success) {
        if (current.code == core::ErrorCode::NOT_FOUND) {
            spdlog::info("Device flow for handle {} cancelled", handle.id);
            return;
        }
        spdlog::warn("Device flow for handle {} waiting on vault: {}", handle.id, current.error);
        reschedule();
        return;
    }
    if (current.record.state != TokenState::PENDING_DEVICE) {
        return;
    }

    auto response = transport_->post_form(poll.config.token_url, {
        {"client_id", poll.config.client_id},
        {"device_code", poll.device_code},
        {"grant_type", DEVICE_GRANT_TYPE},
    });
    if (!response.success) {
        spdlog::warn("Device token poll failed for {}: {}", handle.provider, response.error);
        reschedule();
        return;
    }

    json j = json::parse(response.body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        spdlog::warn("Unreadable device token response from {}", handle.provider);
        reschedule();
        return;
    }

    if (j.contains("access_token")) {
        StoredToken active;
        std::string error;
        if (!apply_token_response(j, active, error)) {
            spdlog::error("Device flow for {} failed: {}", handle.provider, error);
            drop_pending(handle.id);
            return;
        }
        auto stored = commit_record(handle.id, TokenState::PENDING_DEVICE, active);
        if (!stored.success) {
            if (stored.code == core::ErrorCode::NOT_FOUND) {
                spdlog::info("Handle {} was revoked during the token exchange; token discarded", handle.id);
            } else {
                spdlog::error("Failed to store token for handle {}: {}", handle.id, stored.error);
            }
            return;
        }
        spdlog::info("Device flow complete for {} (handle {})", handle.provider, handle.id);
        return;
    }

    std::string error = j.contains("error") && j["error"].is_string() ? j["error"].get<std::string>()
                                                                      : std::string();
    if (error == "authorization_pending") {
        reschedule();
        return;
    }
    if (error == "slow_down") {
        poll.interval = std::max(poll.interval, 0) + SLOW_DOWN_INCREMENT;
        spdlog::debug("Provider {} asked to slow down; polling every {}s", handle.provider, poll.interval);
        reschedule();
        return;
    }

    // access_denied, expired_token or anything unexpected ends the flow
    spdlog::warn("Device flow for {} ended: {}", handle.provider,
                 error.empty() ? describe_http_failure(response) : error);
    drop_pending(handle.id);
}

PkceFlowResult OAuthBroker::request_token_pkce(const std::string& provider,
                                               const std::vector<std::string>& scopes) {
    PkceFlowResult result;

    auto config = get_provider(provider);
    if (!config) {
        result.code = core::ErrorCode::NOT_FOUND;
        result.error = "OAuth provider not registered: " + provider;
        return result;
    }

    auto verifier_bytes = crypto::random_bytes(32);
    auto state_bytes = crypto::random_bytes(16);
    result.handle.id = crypto::random_uuid();
    if (verifier_bytes.empty() || state_bytes.empty() || result.handle.id.empty()) {
        result.code = core::ErrorCode::BACKEND;
        result.error = "failed to generate PKCE parameters";
        return result;
    }
    result.handle.provider = provider;
    result.handle.scopes = scopes;

    std::string verifier = crypto::base64url_encode(verifier_bytes);
    std::string state = crypto::base64url_encode(state_bytes);
    std::string challenge = crypto::base64url_encode(crypto::sha256(verifier));
    crypto::secure_clear(verifier_bytes);

    StoredToken pending;
    pending.state = TokenState::PENDING_PKCE;
    pending.code_verifier = verifier;
    pending.oauth_state = state;
    auto stored = save_record(result.handle.id, pending);
    crypto::secure_clear(verifier);
    if (!stored.success) {
        result.code = stored.code;
        result.error = stored.error;
        return result;
    }

    result.authorization_url = config->auth_url + "?" + form_encode({
        {"response_type", "code"},
        {"client_id", config->client_id},
        {"redirect_uri", config->redirect_uri},
        {"scope", join_scopes(scopes)},
        {"state", state},
        {"code_challenge", challenge},
        {"code_challenge_method", "S256"},
    });

    spdlog::info("Starting PKCE flow for provider: {}", provider);
    result.success = true;
    return result;
}

core::Status OAuthBroker::complete_pkce(const TokenHandle& handle, const std::string& code,
                                        const std::string& state) {
    core::Status error;
    auto config = provider_for(handle, error);
    if (!config) {
        return error;
    }

    auto current = load_record(handle.id);
    if (!current.success) {
        return core::Status::fail(current.code, current.error);
    }
    if (current.record.state != TokenState::PENDING_PKCE || !current.record.code_verifier) {
        return core::Status::fail(core::ErrorCode::VALIDATION,
                                  "handle " + handle.id + " has no pending PKCE authorization");
    }
    if (!current.record.oauth_state || *current.record.oauth_state != state) {
        spdlog::warn("PKCE state mismatch for handle {}", handle.id);
        return core::Status::fail(core::ErrorCode::VALIDATION, "OAuth state mismatch");
    }

    auto response = transport_->post_form(config->token_url, {
        {"grant_type", "authorization_code"},
        {"code", code},
        {"redirect_uri", config->redirect_uri},
        {"client_id", config->client_id},
        {"code_verifier", *current.record.code_verifier},
    });
    if (!is_http_ok(response)) {
        return core::Status::fail(core::ErrorCode::NETWORK,
                                  "authorization code exchange failed: " + describe_http_failure(response));
    }

    json j = json::parse(response.body, nullptr, false);
    StoredToken active;
    std::string parse_error;
    if (j.is_discarded() || !apply_token_response(j, active, parse_error)) {
        return core::Status::fail(core::ErrorCode::NETWORK,
            "authorization code exchange failed: " + (parse_error.empty() ? "unreadable response" : parse_error));
    }

    auto stored = commit_record(handle.id, TokenState::PENDING_PKCE, active);
    if (stored.success) {
        spdlog::info("PKCE flow complete for {} (handle {})", handle.provider, handle.id);
    }
    return stored;
}

core::Status OAuthBroker::refresh(const TokenHandle& handle) {
    core::Status error;
    auto config = provider_for(handle, error);
    if (!config) {
        return error;
    }

    auto current = load_record(handle.id);
    if (!current.success) {
        return core::Status::fail(current.code, current.error);
    }
    if (current.record.state != TokenState::ACTIVE || !current.record.refresh_token) {
        return core::Status::fail(core::ErrorCode::VALIDATION,
                                  "handle " + handle.id + " has no refresh token");
    }

    spdlog::info("Refreshing token for handle: {}", handle.id);
    auto response = transport_->post_form(config->token_url, {
        {"grant_type", "refresh_token"},
        {"refresh_token", *current.record.refresh_token},
        {"client_id", config->client_id},
    });
    if (!is_http_ok(response)) {
        return core::Status::fail(core::ErrorCode::NETWORK,
                                  "token refresh failed: " + describe_http_failure(response));
    }

    json j = json::parse(response.body, nullptr, false);
    StoredToken updated = current.record;
    std::string parse_error;
    if (j.is_discarded() || !apply_token_response(j, updated, parse_error)) {
        return core::Status::fail(core::ErrorCode::NETWORK,
            "token refresh failed: " + (parse_error.empty() ? "unreadable response" : parse_error));
    }
    return commit_record(handle.id, TokenState::ACTIVE, updated);
}

core::Status OAuthBroker::revoke(const TokenHandle& handle, const std::string& agent_id) {
    if (vault_->is_locked()) {
        return core::Status::fail(core::ErrorCode::LOCKED, "vault is locked: cannot revoke " + handle.id);
    }

    spdlog::info("Revoking token for handle: {}", handle.id);

    // Drop the local record first so an in-flight exchange cannot write it back
    std::optional<std::string> provider_token;
    {
        std::lock_guard<std::mutex> lock(records_mutex_);
        auto current = load_record(handle.id);
        if (current.success && current.record.access_token) {
            // Revoking the refresh token also invalidates its access tokens where supported
            provider_token = current.record.refresh_token ? *current.record.refresh_token
                                                          : *current.record.access_token;
        } else if (!current.success && current.code == core::ErrorCode::LOCKED) {
            return core::Status::fail(current.code, current.error);
        }

        auto erased = vault_->erase(handle.id);
        if (!erased.success) {
            if (provider_token) crypto::secure_clear(*provider_token);
            return erased;
        }
    }

    auto config = get_provider(handle.provider);
    if (provider_token && config && config->revocation_url) {
        auto response = transport_->post_form(*config->revocation_url, {
            {"token", *provider_token},
            {"client_id", config->client_id},
        });
        if (!is_http_ok(response)) {
            spdlog::warn("Provider revocation failed for handle {}: {}", handle.id,
                         describe_http_failure(response));
        }
    }
    if (provider_token) {
        crypto::secure_clear(*provider_token);
    }

    std::string capability = "oauth." + handle.provider;
    auto logged = ledger_->log_revoke(agent_id, capability);
    if (!logged.success) {
        return logged;
    }

    RevokeListener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = revoke_listener_;
    }
    if (listener) {
        listener(agent_id, capability);
    }
    return logged;
}

TokenStatus OAuthBroker::status(const TokenHandle& handle) {
    auto current = load_record(handle.id);
    if (!current.success) {
        return current.code == core::ErrorCode::NOT_FOUND ? TokenStatus::MISSING : TokenStatus::UNAVAILABLE;
    }
    return current.record.state == TokenState::ACTIVE ? TokenStatus::ACTIVE : TokenStatus::PENDING;
}

SecretResult OAuthBroker::get_token(const TokenHandle& handle) {
    auto current = load_record(handle.id);
    if (!current.success) {
        return SecretResult::fail(current.code, current.error);
    }
    if (current.record.state != TokenState::ACTIVE || !current.record.access_token) {
        return SecretResult::fail(core::ErrorCode::VALIDATION,
                                  "handle " + handle.id + " is not authorized yet");
    }

    if (current.record.expires_at && *current.record.expires_at <= now_seconds() &&
        current.record.refresh_token) {
        auto refreshed = refresh(handle);
        if (!refreshed.success) {
            return SecretResult::fail(refreshed.code, refreshed.error);
        }
        current = load_record(handle.id);
        if (!current.success) {
            return SecretResult::fail(current.code, current.error);
        }
        if (!current.record.access_token) {
            return SecretResult::fail(core::ErrorCode::BACKEND, "refreshed record has no access token");
        }
    }

    std::string type = current.record.token_type.value_or("Bearer");
    // Providers report "bearer" in lower case; the header scheme is case-insensitive
    if (type == "bearer") type = "Bearer";
    return SecretResult::found(type + " " + *current.record.access_token);
}

HttpResponse OAuthBroker::send_authorized(const TokenHandle& handle, HttpRequest request) {
    auto token = get_token(handle);
    if (!token.success) {
        HttpResponse response;
        response.error = token.error;
        return response;
    }
    request.headers["Authorization"] = token.value;
    crypto::secure_clear(token.value);
    auto response = transport_->send(request);
    crypto::secure_clear(request.headers["Authorization"]);
    return response;
}

void OAuthBroker::wait_idle() {
    poll_pool_.wait_idle();
}

} // namespace warden::oauth
