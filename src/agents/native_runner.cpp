#include "agents/native_runner.hpp"
#include <spdlog/spdlog.h>
#include <system_error>

namespace warden::agents {

SpawnResult NativeRunner::spawn(const std::filesystem::path& executable,
                                const std::vector<std::string>& args) {
    SpawnResult result;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(executable, ec)) {
        result.error = "agent executable not found: " + executable.string();
        return result;
    }

    std::vector<std::string> argv;
    argv.push_back(std::filesystem::absolute(executable, ec).string());
    argv.insert(argv.end(), args.begin(), args.end());

    result.process = core::spawn_process(argv, executable.parent_path(), result.error);
    if (!result.process) {
        spdlog::error("Failed to spawn native agent {}: {}", executable.string(), result.error);
        return result;
    }

    spdlog::info("Spawned native agent {} (PID {})", executable.filename().string(), result.process->pid());
    result.success = true;
    return result;
}

} // namespace warden::agents
