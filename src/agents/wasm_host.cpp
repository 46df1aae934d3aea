#include "agents/wasm_host.hpp"
#include <spdlog/spdlog.h>

namespace warden::agents {

WasmResult UnavailableWasmHost::invoke(const std::filesystem::path& module_path, const std::string&) {
    spdlog::warn("Cannot run {}: no WebAssembly engine available", module_path.string());
    WasmResult result;
    result.error = "WASM support not available in this build";
    return result;
}

} // namespace warden::agents
