#include "core/config.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <limits.h>
#include <unistd.h>

namespace enclave::core::config {

namespace {

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::filesystem::path executable_dir() {
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return {};
    }
    buf[len] = '\0';
    return std::filesystem::path(buf).parent_path();
}

// .env candidates: working directory, executable directory, each with its
// parent, then the caller's extras. No duplicates.
std::vector<std::filesystem::path> dotenv_dirs(const std::vector<std::filesystem::path>& extra) {
    std::vector<std::filesystem::path> dirs;
    auto add = [&dirs](const std::filesystem::path& dir) {
        if (!dir.empty() && std::find(dirs.begin(), dirs.end(), dir) == dirs.end()) {
            dirs.push_back(dir);
        }
    };

    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
        add(cwd);
        add(cwd.parent_path());
    }

    auto exe = executable_dir();
    if (!exe.empty()) {
        add(exe);
        add(exe.parent_path());
    }

    for (const auto& dir : extra) {
        add(dir);
    }
    return dirs;
}

} // namespace

bool parse_dotenv_line(const std::string& line, std::string& key, std::string& value) {
    std::string text = trim(line);
    if (text.empty() || text[0] == '#') {
        return false;
    }
    if (text.rfind("export ", 0) == 0) {
        text = trim(text.substr(7));
    }

    size_t eq = text.find('=');
    if (eq == std::string::npos) {
        return false;
    }
    key = trim(text.substr(0, eq));
    value = trim(text.substr(eq + 1));
    if (key.empty()) {
        return false;
    }

    // Matching single or double quotes are stripped.
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        value = value.substr(1, value.size() - 2);
    }
    return true;
}

void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths) {
    static bool loaded = false;
    if (loaded) return;
    loaded = true;

    for (const auto& dir : dotenv_dirs(extra_search_paths)) {
        auto candidate = dir / ".env";
        std::error_code ec;
        if (!std::filesystem::is_regular_file(candidate, ec)) {
            continue;
        }

        std::ifstream file(candidate);
        std::string line;
        std::string key;
        std::string value;
        while (std::getline(file, line)) {
            if (parse_dotenv_line(line, key, value) && std::getenv(key.c_str()) == nullptr) {
                setenv(key.c_str(), value.c_str(), 0);
            }
        }
        // Only the first .env found is used
        break;
    }
}

std::string get_env(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : std::string();
}

std::string get_env_or(const std::string& key, const std::string& fallback) {
    auto value = get_env(key);
    return value.empty() ? fallback : value;
}

long get_env_int_or(const std::string& key, long fallback) {
    auto value = get_env(key);
    if (value.empty()) {
        return fallback;
    }
    char* end = nullptr;
    long parsed = std::strtol(value.c_str(), &end, 10);
    if (end == value.c_str() || *end != '\0') {
        return fallback;
    }
    return parsed;
}

} // namespace enclave::core::config
