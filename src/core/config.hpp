#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load global config from ~/.zklock/config.yaml
    static Result<Config> load_global();

    // Load project config from ./zklock.yaml
    static Result<Config> load_project(const fs::path& dir = fs::current_path());

    // Load both and combine (project values override global ones), then
    // apply ZKLOCK_HOSTS / ZKLOCK_NAMESPACE from the environment
    static Result<Config> load(const fs::path& project_dir = fs::current_path());

    // Load a single file, then apply environment overrides
    static Result<Config> load_file(const fs::path& path);

    // Parse a YAML document (no environment overrides)
    static Result<Config> from_yaml(const std::string& text);

    // Accessors
    const CoordinationConfig& zookeeper() const { return zookeeper_; }
    const LogConfig& log() const { return log_; }

    Config() = default;

private:
    CoordinationConfig zookeeper_;
    LogConfig log_;

    friend Result<void> overlay_yaml(const std::string& text, const std::string& origin,
                                     Config& config);
    friend void apply_env_overrides(Config& config);
    friend Result<void> validate(const Config& config);
};

// Helper to check if configs exist
bool global_config_exists();
bool project_config_exists(const fs::path& dir = fs::current_path());

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());

// Create default global config
Result<void> create_default_global_config();
