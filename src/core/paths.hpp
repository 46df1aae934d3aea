#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace warden::core::paths {

// Best-effort directory of the current executable; empty if unavailable.
std::filesystem::path executable_dir();

// Search roots for .env files and project-relative agent directories.
std::vector<std::filesystem::path> project_search_paths();

// Find a relative path under any of the search roots.
std::optional<std::filesystem::path> find_relative(const std::string& relative);

// Per-user data directory ($XDG_DATA_HOME/warden or ~/.local/share/warden).
std::filesystem::path data_dir();

// Agents directory: ./agents under a search root if present, otherwise data_dir()/agents.
std::filesystem::path default_agents_dir();

} // namespace warden::core::paths
