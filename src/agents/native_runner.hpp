#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "core/subprocess.hpp"

namespace warden::agents {

using ProcessHandle = std::unique_ptr<core::ChildProcess>;

struct SpawnResult {
    bool success = false;
    std::string error;
    ProcessHandle process;
};

// Starts native agents as child processes with piped standard streams,
// working directory set to the agent's own directory
class NativeRunner {
public:
    virtual ~NativeRunner() = default;

    virtual SpawnResult spawn(const std::filesystem::path& executable,
                              const std::vector<std::string>& args);
};

} // namespace warden::agents
