#include "core/config.hpp"
#include "core/paths.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <mutex>

namespace warden::core::config {

namespace {

std::string trim(const std::string& s, const char* chars) {
    size_t start = s.find_first_not_of(chars);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(chars);
    return s.substr(start, end - start + 1);
}

} // namespace

std::optional<std::pair<std::string, std::string>> parse_dotenv_line(const std::string& line) {
    std::string trimmed = trim(line, " \t\r\n");
    if (trimmed.empty() || trimmed[0] == '#') {
        return std::nullopt;
    }

    if (trimmed.rfind("export ", 0) == 0) {
        trimmed = trim(trimmed.substr(7), " \t");
    }

    size_t eq_pos = trimmed.find('=');
    if (eq_pos == std::string::npos) {
        return std::nullopt;
    }

    std::string key = trim(trimmed.substr(0, eq_pos), " \t");
    std::string value = trim(trimmed.substr(eq_pos + 1), " \t");
    if (key.empty()) {
        return std::nullopt;
    }

    if (value.size() >= 2) {
        if ((value.front() == '"' && value.back() == '"') ||
            (value.front() == '\'' && value.back() == '\'')) {
            value = value.substr(1, value.size() - 2);
        }
    }
    return std::make_pair(key, value);
}

void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths) {
    static std::once_flag loaded;
    std::call_once(loaded, [&extra_search_paths]() {
        std::vector<std::filesystem::path> search_paths = paths::project_search_paths();
        for (const auto& p : extra_search_paths) {
            search_paths.push_back(p);
        }

        for (const auto& base : search_paths) {
            auto env_path = base / ".env";
            std::error_code ec;
            if (!std::filesystem::exists(env_path, ec)) {
                continue;
            }

            std::ifstream file(env_path);
            std::string line;
            size_t applied = 0;
            while (std::getline(file, line)) {
                auto entry = parse_dotenv_line(line);
                if (!entry) continue;
                if (std::getenv(entry->first.c_str()) == nullptr) {
                    setenv(entry->first.c_str(), entry->second.c_str(), 0);
                    ++applied;
                }
            }
            spdlog::debug("Loaded {} variables from {}", applied, env_path.string());
            break;
        }
    });
}

std::string get_env(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : std::string();
}

std::string get_env_or(const std::string& key, const std::string& fallback) {
    auto value = get_env(key);
    return value.empty() ? fallback : value;
}

} // namespace warden::core::config
