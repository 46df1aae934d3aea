#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "agents/capabilities.hpp"
#include "agents/event_protocol.hpp"
#include "agents/native_runner.hpp"
#include "agents/registry.hpp"
#include "agents/runtime.hpp"
#include "agents/wasm_host.hpp"
#include "core/error.hpp"
#include "host/config.hpp"
#include "host/event_bus.hpp"
#include "oauth/broker.hpp"
#include "oauth/consent.hpp"
#include "oauth/http_transport.hpp"
#include "oauth/vault.hpp"
#include "state/sqlite_store.hpp"

namespace warden::host {

struct RunResult {
    bool success = false;
    core::ErrorCode code = core::ErrorCode::NONE;
    std::string error;
    std::vector<agents::Event> events;
};

// Owns one instance of every component for the lifetime of a host session
// and wires them together. Components are handed out as shared handles.
class ControlPlane {
public:
    explicit ControlPlane(ControlPlaneConfig config,
                          std::shared_ptr<oauth::HttpTransport> transport = nullptr,
                          std::shared_ptr<agents::WasmHost> wasm_host = nullptr);
    ~ControlPlane();

    ControlPlane(const ControlPlane&) = delete;
    ControlPlane& operator=(const ControlPlane&) = delete;

    // Open the vault and state database, restore the ledger, register providers
    // and discover agents. Fails only when the vault cannot be opened.
    core::Status init();

    RunResult run_agent(const std::string& name, const std::string& input);

    // Withdraw a previously granted capability; recorded in the ledger so it
    // holds across restarts
    core::Status revoke_capability(const std::string& agent_id, const std::string& capability,
                                   std::optional<std::string> user_id = std::nullopt);

    void set_consent_resolver(agents::ConsentResolver resolver);

    const ControlPlaneConfig& config() const { return config_; }

    std::shared_ptr<agents::AgentRegistry> registry() const { return registry_; }
    std::shared_ptr<agents::CapabilityManager> capabilities() const { return capabilities_; }
    std::shared_ptr<agents::AgentRuntime> runtime() const { return runtime_; }
    std::shared_ptr<oauth::ConsentLedger> ledger() const { return ledger_; }
    std::shared_ptr<oauth::TokenVault> vault() const { return vault_; }
    std::shared_ptr<oauth::OAuthBroker> broker() const { return broker_; }
    std::shared_ptr<EventBus> events() const { return events_; }
    std::shared_ptr<state::SqliteStore> state() const { return state_; }

private:
    // Re-apply restored ledger grants/revocations that are still in force
    size_t replay_ledger();

    void publish(const agents::Event& event);

    ControlPlaneConfig config_;
    std::shared_ptr<oauth::HttpTransport> transport_;

    std::shared_ptr<agents::AgentRegistry> registry_;
    std::shared_ptr<agents::CapabilityManager> capabilities_;
    std::shared_ptr<oauth::ConsentLedger> ledger_;
    std::shared_ptr<EventBus> events_;
    std::shared_ptr<agents::AgentRuntime> runtime_;
    std::shared_ptr<state::SqliteStore> state_;
    std::shared_ptr<oauth::TokenVault> vault_;
    std::shared_ptr<oauth::OAuthBroker> broker_;
};

} // namespace warden::host
