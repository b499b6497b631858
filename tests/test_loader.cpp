/**
 * @file test_loader.cpp
 * @brief Tests for reading sources and locating config files
 */

#include <gtest/gtest.h>
#include "strata/Loader.hpp"
#include "strata/Errors.hpp"
#include "strata/Resolver.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>

namespace fs = std::filesystem;
using namespace strata;

// ============================================================================
// Test fixtures and helpers
// ============================================================================

/**
 * @brief RAII helper for creating temporary directories.
 */
class TempDir {
public:
    TempDir() : path_(fs::temp_directory_path() /
                      ("strata_test_dir_" + std::to_string(std::random_device{}()))) {
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    fs::path path() const { return path_; }

    std::string create_file(const std::string& name, const std::string& content) {
        fs::path file_path = path_ / name;
        fs::create_directories(file_path.parent_path());
        std::ofstream out(file_path);
        out << content;
        return file_path.string();
    }

private:
    fs::path path_;
};

/**
 * @brief RAII helper for environment variables.
 */
class ScopedEnvVar {
public:
    ScopedEnvVar(const std::string& name, const std::string& value) : name_(name) {
        if (const char* old = std::getenv(name.c_str())) original_ = old;
        setenv(name.c_str(), value.c_str(), 1);
    }

    ~ScopedEnvVar() {
        if (original_) {
            setenv(name_.c_str(), original_->c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

private:
    std::string name_;
    std::optional<std::string> original_;
};

// ============================================================================
// Source
// ============================================================================

TEST(Source, AvailableAndUnavailable) {
    Source ok = Source::available("a.toml", "theme = \"nord\"");
    EXPECT_TRUE(ok.is_available());
    EXPECT_EQ(ok.name(), "a.toml");
    EXPECT_EQ(ok.text(), "theme = \"nord\"");
    EXPECT_TRUE(ok.cause().empty());

    Source missing = Source::unavailable("b.toml", "file not found");
    EXPECT_FALSE(missing.is_available());
    EXPECT_EQ(missing.cause(), "file not found");
    EXPECT_TRUE(missing.text().empty());
}

TEST(ReadSource, ReadsExistingFile) {
    TempDir dir;
    std::string path = dir.create_file("config.toml", "theme = \"nord\"\n");

    Source src = read_source(path);
    ASSERT_TRUE(src.is_available());
    EXPECT_EQ(src.name(), path);
    EXPECT_EQ(src.text(), "theme = \"nord\"\n");
}

TEST(ReadSource, EmptyFileIsAvailable) {
    TempDir dir;
    Source src = read_source(dir.create_file("config.toml", ""));
    EXPECT_TRUE(src.is_available());
    EXPECT_TRUE(src.text().empty());
}

TEST(ReadSource, MissingFileIsUnavailable) {
    TempDir dir;
    Source src = read_source((dir.path() / "nope.toml").string());
    EXPECT_FALSE(src.is_available());
    EXPECT_FALSE(src.cause().empty());
}

TEST(ReadSource, DirectoryIsUnavailable) {
    TempDir dir;
    Source src = read_source(dir.path().string());
    EXPECT_FALSE(src.is_available());
    EXPECT_EQ(src.cause(), "not a regular file");
}

// ============================================================================
// Paths
// ============================================================================

TEST(FindWorkspace, StopsAtMarkerDirectory) {
    TempDir dir;
    fs::create_directories(dir.path() / "project" / ".git");
    fs::create_directories(dir.path() / "project" / "src" / "deep");

    std::string found = find_workspace((dir.path() / "project" / "src" / "deep").string());
    EXPECT_EQ(fs::path(found), dir.path() / "project");
}

TEST(FindWorkspace, StrataDirectoryIsAMarker) {
    TempDir dir;
    dir.create_file("project/.strata/config.toml", "");
    fs::create_directories(dir.path() / "project" / "sub");

    std::string found = find_workspace((dir.path() / "project" / "sub").string());
    EXPECT_EQ(fs::path(found), dir.path() / "project");
}

TEST(ConfigDir, PrefersXdgConfigHome) {
    ScopedEnvVar xdg("XDG_CONFIG_HOME", "/tmp/xdg-home");
    EXPECT_EQ(fs::path(config_dir()), fs::path("/tmp/xdg-home") / "strata");
}

TEST(ConfigDir, FallsBackToHome) {
    ScopedEnvVar xdg("XDG_CONFIG_HOME", "");
    ScopedEnvVar home("HOME", "/tmp/some-home");
    EXPECT_EQ(fs::path(config_dir()), fs::path("/tmp/some-home") / ".config" / "strata");
}

TEST(ConfigPaths, DefaultsPointAtConfigToml) {
    ScopedEnvVar xdg("XDG_CONFIG_HOME", "/tmp/xdg-home");
    ConfigPaths paths = ConfigPaths::defaults();
    EXPECT_EQ(fs::path(paths.global), fs::path("/tmp/xdg-home") / "strata" / "config.toml");
    EXPECT_EQ(fs::path(paths.local).filename(), "config.toml");
    EXPECT_EQ(fs::path(paths.local).parent_path().filename(), ".strata");
}

// ============================================================================
// Loading from disk
// ============================================================================

TEST(ResolveDefault, LayersFilesFromDisk) {
    TempDir dir;
    ConfigPaths paths;
    paths.global = dir.create_file("home/config.toml", "theme = \"dracula\"\n[editor]\nscrolloff = 8\n");
    paths.local = dir.create_file("work/.strata/config.toml", "theme = \"nord\"\n");

    ResolvedConfig config = ConfigLoader{}.resolve_default(paths);
    EXPECT_EQ(config.theme, std::optional<std::string>("nord"));
    EXPECT_EQ(config.editor.scrolloff, 8u);
}

TEST(ResolveDefault, MissingWorkspaceFileIsIgnored) {
    TempDir dir;
    ConfigPaths paths;
    paths.global = dir.create_file("config.toml", "theme = \"dracula\"\n");
    paths.local = (dir.path() / ".strata" / "config.toml").string();

    ResolvedConfig config = ConfigLoader{}.resolve_default(paths);
    EXPECT_EQ(config.theme, std::optional<std::string>("dracula"));
}

TEST(ResolveDefault, NoFilesAtAll) {
    TempDir dir;
    ConfigPaths paths;
    paths.global = (dir.path() / "config.toml").string();
    paths.local = (dir.path() / "local.toml").string();

    try {
        ConfigLoader{}.resolve_default(paths);
        FAIL() << "expected SourceUnavailableError";
    } catch (const SourceUnavailableError& e) {
        EXPECT_EQ(e.source(), paths.global);
    }
}

TEST(ResolveDefault, ParseErrorCarriesFilePath) {
    TempDir dir;
    ConfigPaths paths;
    paths.global = dir.create_file("config.toml", "theme = \"nord\"\n");
    paths.local = dir.create_file("local.toml", "\n[editor\n");

    try {
        ConfigLoader{}.resolve_default(paths);
        FAIL() << "expected ConfigParseError";
    } catch (const ConfigParseError& e) {
        EXPECT_EQ(e.source(), paths.local);
        EXPECT_GT(e.line(), 0);
    }
}
