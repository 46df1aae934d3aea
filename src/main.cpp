#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>
#include "core/logger.hpp"
#include "host/config.hpp"
#include "host/control_plane.hpp"

using namespace warden;

namespace {

void print_usage() {
    std::cerr << "usage: warden <command> [args]\n"
              << "\n"
              << "commands:\n"
              << "  list                  registered agents\n"
              << "  run <agent> <input>   execute an agent, asking for consent as needed\n"
              << "  ledger                consent ledger as JSON\n"
              << "  grants                capability grants currently in force\n"
              << "  revoke <agent> <cap>  withdraw consent for a capability\n";
}

std::optional<std::string> current_user() {
    const char* user = std::getenv("USER");
    if (user) {
        return std::string(user);
    }
    return std::nullopt;
}

// Ask on the terminal: y = until revoked, a number = that many seconds, anything else denies
agents::ConsentDecision prompt_consent(const std::string& agent_id,
                                       const agents::ConsentRequestEvent& request) {
    std::optional<std::string> user_id = current_user();

    std::cerr << "\n" << agent_id << " requests capability '" << request.capability << "'"
              << " (" << request.reason << ")\n"
              << "Allow? [y = always, <seconds> = for a while, N = deny]: " << std::flush;

    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return agents::ConsentDecision::deny("no answer", user_id);
    }
    if (answer == "y" || answer == "Y" || answer == "yes") {
        return agents::ConsentDecision::grant(std::nullopt, user_id);
    }
    if (!answer.empty() && answer.find_first_not_of("0123456789") == std::string::npos) {
        try {
            return agents::ConsentDecision::grant(std::chrono::seconds(std::stoll(answer)), user_id);
        } catch (const std::out_of_range&) {
            return agents::ConsentDecision::deny("invalid duration", user_id);
        }
    }
    return agents::ConsentDecision::deny("denied by user", user_id);
}

int cmd_list(host::ControlPlane& plane) {
    auto agents = plane.registry()->list();
    if (agents.empty()) {
        std::cout << "No agents found in " << plane.config().agents_dir.string() << "\n";
        return 0;
    }
    for (const auto& agent : agents) {
        const auto& m = agent.manifest;
        std::cout << m.name << " " << m.version
                  << " [" << agents::sandbox_mode_to_string(m.sandbox) << "]"
                  << (agent.enabled ? "" : " (disabled)") << "\n";
        for (const auto& cap : m.capabilities) {
            std::cout << "    " << cap << "\n";
        }
    }
    return 0;
}

int cmd_run(host::ControlPlane& plane, const std::string& name, const std::string& input) {
    plane.set_consent_resolver(prompt_consent);

    auto result = plane.run_agent(name, input);
    if (!result.success) {
        spdlog::error("{}", result.error);
        return 1;
    }

    int exit_code = 0;
    for (const auto& event : result.events) {
        if (const auto* output = event.as<agents::OutputEvent>()) {
            std::cout.write(reinterpret_cast<const char*>(output->data.data()),
                            static_cast<std::streamsize>(output->data.size()));
        } else if (const auto* error = event.as<agents::ErrorEvent>()) {
            std::cerr << "error: " << error->code << ": " << error->message << "\n";
            if (error->hint) {
                std::cerr << *error->hint << "\n";
            }
            exit_code = 1;
        }
    }
    std::cout << std::flush;
    return exit_code;
}

int cmd_grants(host::ControlPlane& plane) {
    auto grants = plane.capabilities()->active_grants();
    if (grants.empty()) {
        std::cout << "No active grants\n";
        return 0;
    }
    auto now = agents::Clock::now();
    for (const auto& grant : grants) {
        std::cout << grant.capability.to_string();
        if (grant.expires_at) {
            auto left = std::chrono::duration_cast<std::chrono::seconds>(*grant.expires_at - now);
            std::cout << " (expires in " << left.count() << "s)";
        }
        std::cout << "\n";
    }
    return 0;
}

int cmd_revoke(host::ControlPlane& plane, const std::string& agent_id, const std::string& capability) {
    auto status = plane.revoke_capability(agent_id, capability, current_user());
    if (!status.success) {
        std::cerr << "error: " << status.error << "\n";
        return 1;
    }
    std::cout << "Revoked " << capability << " for " << agent_id << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    core::init_logger();

    if (argc < 2) {
        print_usage();
        return 2;
    }
    std::string command = argv[1];

    auto config = host::load_config_from_env();
    core::set_log_level(core::log_level_from_string(config.log_level));

    host::ControlPlane plane(config);
    auto status = plane.init();
    if (!status.success) {
        spdlog::error("{}", status.error);
        return 1;
    }

    if (command == "list") {
        return cmd_list(plane);
    }
    if (command == "run") {
        if (argc < 4) {
            print_usage();
            return 2;
        }
        std::string input = argv[3];
        for (int i = 4; i < argc; i++) {
            input += " ";
            input += argv[i];
        }
        return cmd_run(plane, argv[2], input);
    }
    if (command == "ledger") {
        std::cout << plane.ledger()->export_json() << "\n";
        return 0;
    }
    if (command == "grants") {
        return cmd_grants(plane);
    }
    if (command == "revoke") {
        if (argc < 4) {
            print_usage();
            return 2;
        }
        return cmd_revoke(plane, argv[2], argv[3]);
    }

    std::cerr << "unknown command: " << command << "\n";
    print_usage();
    return 2;
}
