#include "host/control_plane.hpp"
#include <spdlog/spdlog.h>

namespace warden::host {

ControlPlane::ControlPlane(ControlPlaneConfig config,
                           std::shared_ptr<oauth::HttpTransport> transport,
                           std::shared_ptr<agents::WasmHost> wasm_host)
    : config_(std::move(config))
    , transport_(std::move(transport))
    , registry_(std::make_shared<agents::AgentRegistry>())
    , capabilities_(std::make_shared<agents::CapabilityManager>())
    , ledger_(std::make_shared<oauth::ConsentLedger>())
    , events_(std::make_shared<EventBus>()) {
    if (!transport_) {
        transport_ = std::make_shared<oauth::HttplibTransport>();
    }
    if (!wasm_host) {
        wasm_host = std::make_shared<agents::UnavailableWasmHost>();
    }
    runtime_ = std::make_shared<agents::AgentRuntime>(capabilities_, ledger_, std::move(wasm_host),
                                                      std::make_shared<agents::NativeRunner>());
    runtime_->set_event_sink([this](const agents::Event& event) { publish(event); });
}

ControlPlane::~ControlPlane() {
    // Stop background polling before the vault goes away
    broker_.reset();
}

core::Status ControlPlane::init() {
    std::string error;

    if (!config_.state_db.empty()) {
        auto store = state::SqliteStore::open(config_.state_db, error);
        if (store) {
            state_ = std::move(store);
            ledger_->attach_store(state_);
            ledger_->restore();
            replay_ledger();
        } else {
            spdlog::warn("Continuing without durable state: {}", error);
            error.clear();
        }
    }

    vault_ = oauth::TokenVault::create(config_.vault_backend, error);
    if (!vault_) {
        return core::Status::fail(core::ErrorCode::BACKEND, "failed to open token vault: " + error);
    }

    broker_ = std::make_shared<oauth::OAuthBroker>(vault_, ledger_, transport_);
    broker_->set_revoke_listener([this](const std::string& agent_id, const std::string& capability) {
        runtime_->announce_revoke(agent_id, capability);
    });
    if (!config_.github_client_id.empty()) {
        broker_->register_provider("github", oauth::github_provider(config_.github_client_id));
    }
    if (!config_.google_client_id.empty()) {
        broker_->register_provider("google", oauth::google_provider(config_.google_client_id));
    }

    size_t discovered = registry_->discover(config_.agents_dir);
    spdlog::info("Control plane ready: {} agents, {} vault", discovered,
                 oauth::vault_backend_name(config_.vault_backend));
    return core::Status::ok();
}

size_t ControlPlane::replay_ledger() {
    auto now = agents::Clock::now();
    size_t applied = 0;

    for (const auto& entry : ledger_->get_all()) {
        auto parsed = agents::parse_capability(oauth::consent_action_capability(entry.action));
        if (!parsed.success) {
            continue;
        }

        if (const auto* grant = std::get_if<oauth::GrantAction>(&entry.action)) {
            std::optional<std::chrono::milliseconds> remaining;
            if (grant->duration_s) {
                auto expires_at = entry.timestamp + std::chrono::seconds(*grant->duration_s);
                if (expires_at < now) {
                    continue;
                }
                remaining = std::chrono::duration_cast<std::chrono::milliseconds>(expires_at - now);
            }
            capabilities_->grant(parsed.capability, remaining);
            applied++;
        } else if (std::holds_alternative<oauth::RevokeAction>(entry.action)) {
            // Nothing to undo when the grant already lapsed
            if (capabilities_->revoke(parsed.capability).success) {
                applied++;
            }
        }
    }

    capabilities_->cleanup_expired();
    if (applied > 0) {
        spdlog::info("Replayed {} consent decisions from the ledger", applied);
    }
    return applied;
}

core::Status ControlPlane::revoke_capability(const std::string& agent_id, const std::string& capability,
                                             std::optional<std::string> user_id) {
    return runtime_->revoke(agent_id, capability, std::move(user_id));
}

void ControlPlane::set_consent_resolver(agents::ConsentResolver resolver) {
    runtime_->set_consent_resolver(std::move(resolver));
}

RunResult ControlPlane::run_agent(const std::string& name, const std::string& input) {
    RunResult result;
    auto agent = registry_->get(name);
    if (!agent) {
        result.code = core::ErrorCode::NOT_FOUND;
        result.error = "unknown agent: " + name;
        return result;
    }
    result.events = runtime_->execute(*agent, input);
    result.success = true;
    return result;
}

void ControlPlane::publish(const agents::Event& event) {
    events_->publish(event);

    if (!state_) {
        return;
    }
    auto stored = state_->append_event(
        std::chrono::duration_cast<std::chrono::milliseconds>(event.timestamp.time_since_epoch()).count(),
        agents::event_kind_to_string(event.kind()), event.agent_id, event.to_json().dump());
    if (!stored.success) {
        spdlog::warn("Event #{} not persisted: {}", event.sequence, stored.error);
    }

    if (const auto* artifact = event.as<agents::ArtifactEvent>()) {
        state::ArtifactRecord record;
        record.id = artifact->id;
        record.kind = artifact->kind;
        record.path = artifact->path;
        record.agent_id = event.agent_id;
        auto indexed = state_->index_artifact(record);
        if (!indexed.success) {
            spdlog::warn("Artifact {} not indexed: {}", artifact->id, indexed.error);
        }
    }
}

} // namespace warden::host
