#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "agents/capabilities.hpp"
#include "agents/event_protocol.hpp"
#include "agents/manifest.hpp"
#include "agents/native_runner.hpp"
#include "agents/registry.hpp"
#include "agents/wasm_host.hpp"

namespace warden::oauth {
class ConsentLedger;
}

namespace warden::agents {

// Host answer to a consent request
struct ConsentDecision {
    enum class Kind { GRANT, DENY };

    Kind kind = Kind::DENY;
    std::optional<std::chrono::seconds> duration;   // unset = until revoked
    std::string reason;
    std::optional<std::string> user_id;

    static ConsentDecision grant(std::optional<std::chrono::seconds> duration = std::nullopt,
                                 std::optional<std::string> user_id = std::nullopt) {
        ConsentDecision decision;
        decision.kind = Kind::GRANT;
        decision.duration = duration;
        decision.user_id = std::move(user_id);
        return decision;
    }

    static ConsentDecision deny(std::string reason, std::optional<std::string> user_id = std::nullopt) {
        ConsentDecision decision;
        decision.kind = Kind::DENY;
        decision.reason = std::move(reason);
        decision.user_id = std::move(user_id);
        return decision;
    }
};

// Asked (blocking) for every declared capability that is not yet granted
using ConsentResolver = std::function<ConsentDecision(const std::string& agent_id,
                                                      const ConsentRequestEvent& request)>;

// Receives every event the runtime emits, in emission order
using EventSink = std::function<void(const Event&)>;

// Enforces declared capabilities and dispatches agents to their backend
class AgentRuntime {
public:
    AgentRuntime(std::shared_ptr<CapabilityManager> capabilities,
                 std::shared_ptr<oauth::ConsentLedger> ledger,
                 std::shared_ptr<WasmHost> wasm_host,
                 std::shared_ptr<NativeRunner> native_runner);

    void set_consent_resolver(ConsentResolver resolver);
    void set_event_sink(EventSink sink);

    // Entry point resolved against the current directory
    std::vector<Event> execute(const Manifest& manifest, const std::string& input);

    // Entry point resolved against the agent's directory
    std::vector<Event> execute(const AgentInfo& agent, const std::string& input);

    // Withdraw consent: revoke the grant, record it in the ledger and emit
    // consent_revoke. NOT_FOUND when nothing live was granted.
    core::Status revoke(const std::string& agent_id, const std::string& capability,
                        std::optional<std::string> user_id = std::nullopt);

    // Emit consent_revoke for a revocation already recorded elsewhere (OAuth tokens)
    void announce_revoke(const std::string& agent_id, const std::string& capability);

    std::shared_ptr<CapabilityManager> capability_manager() const { return capabilities_; }
    uint64_t last_sequence(const std::string& agent_id) const { return sequencer_.current(agent_id); }

private:
    class Emitter;

    std::vector<Event> run(const Manifest& manifest, const std::filesystem::path& base_dir,
                           const std::string& input);

    // Grant or deny every declared capability. False when execution must stop.
    bool authorize(const Manifest& manifest, Emitter& emit, std::vector<Capability>& granted);

    // Issue and redeem one ticket per granted capability. Unused tickets are discarded on failure.
    bool redeem_tickets(const Manifest& manifest, const std::vector<Capability>& granted, Emitter& emit);

    void dispatch_wasm(const Manifest& manifest, const std::filesystem::path& base_dir,
                       const std::string& input, Emitter& emit);
    void dispatch_native(const Manifest& manifest, const std::filesystem::path& base_dir,
                         const std::string& input, Emitter& emit);

    std::shared_ptr<CapabilityManager> capabilities_;
    std::shared_ptr<oauth::ConsentLedger> ledger_;
    std::shared_ptr<WasmHost> wasm_host_;
    std::shared_ptr<NativeRunner> native_runner_;
    ConsentResolver resolver_;
    EventSink sink_;
    EventSequencer sequencer_;
};

} // namespace warden::agents
