#pragma once
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <sys/stat.h>
#include <nlohmann/json.hpp>

namespace warden::testing {

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "warden-test-XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        char* made = mkdtemp(buf.data());
        path_ = made ? std::filesystem::path(made) : std::filesystem::path();
    }

    ~TempDir() {
        std::error_code ec;
        if (!path_.empty()) {
            std::filesystem::remove_all(path_, ec);
        }
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& path, const std::string& contents) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
}

inline void make_executable(const std::filesystem::path& path) {
    ::chmod(path.c_str(), 0755);
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline nlohmann::json manifest_json(const std::string& name, const std::string& sandbox,
                                    const std::vector<std::string>& capabilities,
                                    const std::string& entry = "agent.wasm") {
    return {
        {"schema_version", "0.1"},
        {"name", name},
        {"version", "1.0.0"},
        {"entry", entry},
        {"sandbox", sandbox},
        {"capabilities", capabilities},
    };
}

// Write dir/<name>/manifest.json and return the agent directory
inline std::filesystem::path write_agent(const std::filesystem::path& root, const std::string& dir_name,
                                         const nlohmann::json& manifest) {
    auto dir = root / dir_name;
    write_file(dir / "manifest.json", manifest.dump(2));
    return dir;
}

} // namespace warden::testing
