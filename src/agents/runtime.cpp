#include "agents/runtime.hpp"
#include "oauth/consent.hpp"
#include <spdlog/spdlog.h>

namespace warden::agents {

// Stamps payloads with the agent's next sequence number, forwards them to the
// sink and keeps them for the caller
class AgentRuntime::Emitter {
public:
    Emitter(EventSequencer& sequencer, const EventSink& sink, std::string agent_id)
        : sequencer_(sequencer), sink_(sink), agent_id_(std::move(agent_id)) {}

    void operator()(EventPayload payload) {
        Event event = Event::make(std::move(payload), agent_id_, sequencer_.next(agent_id_));
        if (sink_) {
            sink_(event);
        }
        events_.push_back(std::move(event));
    }

    void error(const char* code, const std::string& message,
               std::optional<std::string> hint = std::nullopt) {
        spdlog::warn("Agent {}: {} ({})", agent_id_, message, code);
        (*this)(ErrorEvent{code, message, std::move(hint)});
    }

    const std::string& agent_id() const { return agent_id_; }
    std::vector<Event> take() { return std::move(events_); }

private:
    EventSequencer& sequencer_;
    const EventSink& sink_;
    std::string agent_id_;
    std::vector<Event> events_;
};

AgentRuntime::AgentRuntime(std::shared_ptr<CapabilityManager> capabilities,
                           std::shared_ptr<oauth::ConsentLedger> ledger,
                           std::shared_ptr<WasmHost> wasm_host,
                           std::shared_ptr<NativeRunner> native_runner)
    : capabilities_(std::move(capabilities))
    , ledger_(std::move(ledger))
    , wasm_host_(std::move(wasm_host))
    , native_runner_(std::move(native_runner)) {}

void AgentRuntime::set_consent_resolver(ConsentResolver resolver) {
    resolver_ = std::move(resolver);
}

void AgentRuntime::set_event_sink(EventSink sink) {
    sink_ = std::move(sink);
}

std::vector<Event> AgentRuntime::execute(const Manifest& manifest, const std::string& input) {
    return run(manifest, {}, input);
}

std::vector<Event> AgentRuntime::execute(const AgentInfo& agent, const std::string& input) {
    if (!agent.enabled) {
        Emitter emit(sequencer_, sink_, agent.manifest.name);
        emit.error(error_codes::AGENT_DISABLED, "agent " + agent.manifest.name + " is disabled");
        return emit.take();
    }
    return run(agent.manifest, agent.base_dir, input);
}

std::vector<Event> AgentRuntime::run(const Manifest& manifest, const std::filesystem::path& base_dir,
                                     const std::string& input) {
    Emitter emit(sequencer_, sink_, manifest.name);
    emit(InputEvent{input, {}});

    std::vector<Capability> granted;
    if (!authorize(manifest, emit, granted)) {
        return emit.take();
    }

    if (!redeem_tickets(manifest, granted, emit)) {
        return emit.take();
    }

    if (manifest.requires_native()) {
        dispatch_native(manifest, base_dir, input, emit);
    } else {
        dispatch_wasm(manifest, base_dir, input, emit);
    }
    return emit.take();
}

core::Status AgentRuntime::revoke(const std::string& agent_id, const std::string& capability,
                                  std::optional<std::string> user_id) {
    auto parsed = parse_capability(capability);
    if (!parsed.success) {
        return core::Status::fail(parsed.code, parsed.error);
    }

    auto revoked = capabilities_->revoke(parsed.capability);
    if (!revoked.success) {
        return revoked;
    }

    // The ledger is what keeps the revoke across a restart
    auto logged = ledger_->log_revoke(agent_id, capability, user_id);
    if (!logged.success) {
        spdlog::error("Failed to record consent revoke for {}: {}", agent_id, logged.error);
    }

    Emitter emit(sequencer_, sink_, agent_id);
    emit(ConsentRevokeEvent{capability});
    spdlog::info("Consent for {} withdrawn from agent {}", capability, agent_id);
    return logged;
}

void AgentRuntime::announce_revoke(const std::string& agent_id, const std::string& capability) {
    Emitter emit(sequencer_, sink_, agent_id);
    emit(ConsentRevokeEvent{capability});
}

bool AgentRuntime::redeem_tickets(const Manifest& manifest, const std::vector<Capability>& granted,
                                  Emitter& emit) {
    // Tickets tie the checks in authorize to this dispatch; a revoke in between is caught on redeem
    std::vector<ExecutionTicket> tickets;
    auto discard_rest = [&](size_t from) {
        for (size_t i = from; i < tickets.size(); ++i) {
            capabilities_->discard(tickets[i]);
        }
    };

    for (const auto& capability : granted) {
        auto issued = capabilities_->issue_ticket(manifest.name, capability);
        if (!issued.success) {
            discard_rest(0);
            emit.error(error_codes::CAPABILITY_REVOKED,
                       "capability " + capability.to_string() + " was revoked before dispatch");
            return false;
        }
        tickets.push_back(issued.ticket);
    }
    for (size_t i = 0; i < tickets.size(); ++i) {
        auto redeemed = capabilities_->redeem(tickets[i]);
        if (!redeemed.success) {
            discard_rest(i + 1);
            emit.error(error_codes::CAPABILITY_REVOKED,
                       "capability " + tickets[i].capability.to_string() + " is no longer granted: " +
                       redeemed.error);
            return false;
        }
    }
    return true;
}

bool AgentRuntime::authorize(const Manifest& manifest, Emitter& emit, std::vector<Capability>& granted) {
    const std::string& agent_id = manifest.name;

    for (const auto& cap_str : manifest.capabilities) {
        auto parsed = parse_capability(cap_str);
        if (!parsed.success) {
            emit.error(error_codes::CAPABILITY_FORMAT, parsed.error);
            return false;
        }

        if (capabilities_->check(parsed.capability)) {
            granted.push_back(parsed.capability);
            continue;
        }

        ConsentRequestEvent request{cap_str, "required by agent " + agent_id, std::nullopt};
        emit(request);

        ConsentDecision decision = resolver_
            ? resolver_(agent_id, request)
            : ConsentDecision::deny("no consent resolver configured");

        if (decision.kind == ConsentDecision::Kind::GRANT) {
            std::optional<std::chrono::milliseconds> duration;
            std::optional<uint64_t> duration_s;
            if (decision.duration) {
                duration = std::chrono::duration_cast<std::chrono::milliseconds>(*decision.duration);
                duration_s = static_cast<uint64_t>(decision.duration->count());
            }
            auto grant = capabilities_->grant(parsed.capability, duration);
            auto logged = ledger_->log_grant(agent_id, cap_str, duration_s, decision.user_id);
            if (!logged.success) {
                spdlog::error("Failed to record consent grant for {}: {}", agent_id, logged.error);
            }
            emit(ConsentGrantEvent{cap_str, grant.expires_at});
            granted.push_back(parsed.capability);
            continue;
        }

        auto logged = ledger_->log_deny(agent_id, cap_str, decision.reason, decision.user_id);
        if (!logged.success) {
            spdlog::error("Failed to record consent denial for {}: {}", agent_id, logged.error);
        }
        emit.error(error_codes::CAPABILITY_DENIED,
                   "capability " + cap_str + " denied" +
                   (decision.reason.empty() ? std::string() : ": " + decision.reason));
        return false;
    }
    return true;
}

void AgentRuntime::dispatch_wasm(const Manifest& manifest, const std::filesystem::path& base_dir,
                                 const std::string& input, Emitter& emit) {
    spdlog::info("Executing WASM agent: {}", manifest.name);
    if (!wasm_host_) {
        emit.error(error_codes::BACKEND, "no WASM host configured");
        return;
    }

    auto result = wasm_host_->invoke(manifest.entry_path(base_dir), input);
    if (!result.success) {
        emit.error(error_codes::BACKEND, result.error);
        return;
    }
    std::vector<uint8_t> data(result.output.begin(), result.output.end());
    emit(OutputEvent{0, "text/plain", std::move(data), true});
}

void AgentRuntime::dispatch_native(const Manifest& manifest, const std::filesystem::path& base_dir,
                                   const std::string& input, Emitter& emit) {
    spdlog::info("Executing native agent: {}", manifest.name);
    if (!native_runner_) {
        emit.error(error_codes::BACKEND, "no native runner configured");
        return;
    }

    auto spawned = native_runner_->spawn(manifest.entry_path(base_dir), {});
    if (!spawned.success) {
        emit.error(error_codes::BACKEND, spawned.error);
        return;
    }

    auto output = spawned.process->communicate(input);
    if (!output.success) {
        emit.error(error_codes::BACKEND, "lost contact with agent process: " + output.error);
        return;
    }

    std::vector<uint8_t> data(output.out.begin(), output.out.end());
    emit(OutputEvent{0, "text/plain", std::move(data), true});

    if (output.exit_code != 0) {
        std::string message = "agent exited with code " + std::to_string(output.exit_code);
        std::optional<std::string> hint;
        if (!output.err.empty()) {
            hint = output.err;
        }
        emit.error(error_codes::AGENT_EXIT, message, hint);
    }
}

} // namespace warden::agents
