/**
 * @file Loader.cpp
 * @brief File reading and config path discovery
 */

#include "strata/Loader.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace strata {

namespace {

const std::string kEmpty;

/**
 * @brief Get environment variable value, nullopt when unset or empty.
 */
std::optional<std::string> env_var(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

} // anonymous namespace

// ============================================================================
// Source
// ============================================================================

Source Source::available(std::string name, std::string text) {
    Source src;
    src.name_ = std::move(name);
    src.text_ = std::move(text);
    return src;
}

Source Source::unavailable(std::string name, std::string cause) {
    Source src;
    src.name_ = std::move(name);
    src.cause_ = std::move(cause);
    return src;
}

const std::string& Source::text() const noexcept {
    return text_ ? *text_ : kEmpty;
}

Source read_source(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Source::unavailable(path, ec ? ec.message() : "file not found");
    }
    if (!fs::is_regular_file(path, ec)) {
        return Source::unavailable(path, "not a regular file");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Source::unavailable(path, std::strerror(errno));
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return Source::unavailable(path, "read failed");
    }
    return Source::available(path, ss.str());
}

// ============================================================================
// Paths
// ============================================================================

std::string find_workspace(const std::string& start_dir) {
    fs::path start;

    if (start_dir.empty()) {
        std::error_code ec;
        start = fs::current_path(ec);
        if (ec) return ".";
    } else {
        start = start_dir;
    }

    // Search current directory and parent directories
    fs::path search_path = start;
    while (!search_path.empty()) {
        std::error_code ec;
        if (fs::exists(search_path / ".git", ec) || fs::exists(search_path / ".strata", ec)) {
            return search_path.string();
        }

        fs::path parent = search_path.parent_path();
        if (parent == search_path) {
            // Reached root, stop
            break;
        }
        search_path = parent;
    }

    return start.string();
}

std::string config_dir() {
    if (auto xdg = env_var("XDG_CONFIG_HOME")) {
        return (fs::path(*xdg) / "strata").string();
    }
    if (auto home = env_var("HOME")) {
        return (fs::path(*home) / ".config" / "strata").string();
    }
    return (fs::path(".config") / "strata").string();
}

ConfigPaths ConfigPaths::defaults() {
    ConfigPaths paths;
    paths.global = (fs::path(config_dir()) / "config.toml").string();
    paths.local = (fs::path(find_workspace()) / ".strata" / "config.toml").string();
    return paths;
}

} // namespace strata
