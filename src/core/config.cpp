#include "core/config.hpp"
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <spdlog/spdlog.h>

namespace conduit::core::config {

namespace {

std::string trim(const std::string& s, const char* chars) {
    size_t start = s.find_first_not_of(chars);
    if (start == std::string::npos) return {};
    size_t end = s.find_last_not_of(chars);
    return s.substr(start, end - start + 1);
}

} // namespace

std::vector<std::filesystem::path> default_search_paths() {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        return {};
    }
    std::vector<std::filesystem::path> roots{cwd};
    if (cwd.has_parent_path() && cwd.parent_path() != cwd) {
        roots.push_back(cwd.parent_path());
        auto grand = cwd.parent_path().parent_path();
        if (!grand.empty() && grand != cwd.parent_path()) {
            roots.push_back(grand);
        }
    }
    return roots;
}

int apply_dotenv_file(const std::filesystem::path& env_path) {
    std::ifstream file(env_path);
    if (!file) {
        return 0;
    }

    int applied = 0;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line, " \t\r\n");

        // Skip comments
        if (line.empty() || line[0] == '#') continue;

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq_pos), " \t");
        std::string value = trim(line.substr(eq_pos + 1), " \t");

        if (value.size() >= 2) {
            if ((value.front() == '"' && value.back() == '"') ||
                (value.front() == '\'' && value.back() == '\'')) {
                value = value.substr(1, value.size() - 2);
            }
        }

        if (!key.empty() && std::getenv(key.c_str()) == nullptr) {
            setenv(key.c_str(), value.c_str(), 0);
            ++applied;
        }
    }
    return applied;
}

void load_dotenv(const std::vector<std::filesystem::path>& search_paths) {
    static std::once_flag loaded;
    std::call_once(loaded, [&search_paths]() {
        for (const auto& base : search_paths) {
            auto env_path = base / ".env";
            std::error_code ec;
            if (!std::filesystem::exists(env_path, ec)) {
                continue;
            }
            int applied = apply_dotenv_file(env_path);
            spdlog::debug("Loaded {} variable(s) from {}", applied, env_path.string());
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

} // namespace conduit::core::config
