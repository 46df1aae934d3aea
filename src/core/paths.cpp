#include "core/paths.hpp"
#include <cstdlib>
#include <unistd.h>
#include <limits.h>

namespace warden::core::paths {

std::filesystem::path executable_dir() {
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return {};
    }
    buf[len] = '\0';
    return std::filesystem::path(buf).parent_path();
}

std::vector<std::filesystem::path> project_search_paths() {
    std::vector<std::filesystem::path> roots;
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
        roots.push_back(cwd);
        roots.push_back(cwd.parent_path());
    }

    auto exe_dir = executable_dir();
    if (!exe_dir.empty()) {
        roots.push_back(exe_dir);
        roots.push_back(exe_dir.parent_path());
    }

    // De-duplicate while preserving order.
    std::vector<std::filesystem::path> unique;
    for (const auto& p : roots) {
        if (p.empty()) continue;
        bool seen = false;
        for (const auto& u : unique) {
            if (u == p) {
                seen = true;
                break;
            }
        }
        if (!seen) {
            unique.push_back(p);
        }
    }
    return unique;
}

std::optional<std::filesystem::path> find_relative(const std::string& relative) {
    for (const auto& base : project_search_paths()) {
        auto candidate = base / relative;
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec)) {
            return std::filesystem::canonical(candidate, ec);
        }
    }
    return std::nullopt;
}

std::filesystem::path data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg) {
        return std::filesystem::path(xdg) / "warden";
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return std::filesystem::path(home) / ".local" / "share" / "warden";
    }
    return std::filesystem::temp_directory_path() / "warden";
}

std::filesystem::path default_agents_dir() {
    auto local = find_relative("agents");
    if (local && std::filesystem::is_directory(*local)) {
        return *local;
    }
    return data_dir() / "agents";
}

} // namespace warden::core::paths
