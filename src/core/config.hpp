#pragma once

#include <string>
#include <optional>
#include <memory>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Built-in policy used when no configuration file overrides it.
ValidationPolicy default_policy();

// Commented YAML equivalent of default_policy(), written by init-config.
std::string default_config_yaml();

class Config {
public:
    // Built-in defaults only.
    static Config defaults();

    // Defaults overlaid with <dir>/cmdgate.yaml (must exist).
    static Result<Config> load_project(const fs::path& dir = fs::current_path());

    // Defaults, then the global file, then the project file, each if present.
    static Result<Config> load(const fs::path& project_dir = fs::current_path());

    // Defaults overlaid with one explicit file (must exist).
    static Result<Config> load_file(const fs::path& path);

    // Defaults overlaid with YAML text. Used by the loaders and by tests.
    static Result<Config> parse(const std::string& yaml_text);

    // Copy of this configuration with working directories confined to `root`.
    Config with_project_root(const fs::path& root) const;

    // Immutable policy shared by every request for the life of the process.
    std::shared_ptr<const ValidationPolicy> policy() const { return policy_; }

    // Files that contributed, in load order. Empty for built-in defaults.
    const std::vector<fs::path>& sources() const { return sources_; }

public:
    Config() = default;

private:
    std::shared_ptr<const ValidationPolicy> policy_;
    std::vector<fs::path> sources_;

    friend class ConfigBuilder;
};

// Helper to check if configs exist
bool global_config_exists();
bool project_config_exists(const fs::path& dir = fs::current_path());

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());

// Write the default config to `path` unless a file is already there.
Result<void> create_default_config(const fs::path& path);
