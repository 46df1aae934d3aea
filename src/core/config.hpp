#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace warden::core::config {

// Parse one KEY=VALUE line of a .env file. Comments and blank lines yield nullopt.
std::optional<std::pair<std::string, std::string>> parse_dotenv_line(const std::string& line);

// Load environment variables from the first .env file found (idempotent).
// Variables already present in the environment are never overwritten.
void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths = {});

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

} // namespace warden::core::config
