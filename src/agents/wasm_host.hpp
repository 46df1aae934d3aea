#pragma once
#include <filesystem>
#include <string>

namespace warden::agents {

struct WasmResult {
    bool success = false;
    std::string output;
    std::string error;
};

// Executes a WebAssembly agent module
class WasmHost {
public:
    virtual ~WasmHost() = default;

    virtual bool available() const = 0;
    virtual WasmResult invoke(const std::filesystem::path& module_path, const std::string& input) = 0;
};

// Host used when no WebAssembly engine is linked in; every invocation fails
class UnavailableWasmHost : public WasmHost {
public:
    bool available() const override { return false; }
    WasmResult invoke(const std::filesystem::path& module_path, const std::string& input) override;
};

} // namespace warden::agents
