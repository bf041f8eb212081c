#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

// Accepts a YAML sequence or a single comma-separated string.
static std::vector<std::string> parse_hosts(const YAML::Node& node) {
    std::vector<std::string> hosts;
    auto add = [&hosts](const std::string& raw) {
        std::stringstream ss(raw);
        std::string item;
        while (std::getline(ss, item, ',')) {
            auto start = item.find_first_not_of(" \t");
            if (start == std::string::npos) continue;
            item = item.substr(start, item.find_last_not_of(" \t") - start + 1);
            hosts.push_back(item);
        }
    };

    if (node.IsSequence()) {
        for (const auto& h : node) add(h.as<std::string>(""));
    } else if (node.IsScalar()) {
        add(node.as<std::string>(""));
    }
    return hosts;
}

static void parse_zookeeper_config(const YAML::Node& node, CoordinationConfig& zk) {
    if (node["hosts"]) zk.hosts = parse_hosts(node["hosts"]);
    if (node["namespace"]) zk.lock_namespace = node["namespace"].as<std::string>("");
    if (node["session_timeout"])
        zk.session_timeout = node["session_timeout"].as<int>(DEFAULT_SESSION_TIMEOUT_SECS);
    if (node["connect_timeout"])
        zk.connect_timeout = node["connect_timeout"].as<int>(DEFAULT_CONNECT_TIMEOUT_SECS);
}

Result<void> overlay_yaml(const std::string& text, const std::string& origin, Config& config) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        return Result<void>::Err(origin + ": " + e.what());
    }
    if (root.IsNull()) return Result<void>::Ok();
    if (!root.IsMap()) return Result<void>::Err(origin + ": expected a mapping at top level");

    try {
        if (root["zookeeper"] && root["zookeeper"].IsMap())
            parse_zookeeper_config(root["zookeeper"], config.zookeeper_);
        if (root["log"] && root["log"].IsMap() && root["log"]["path"])
            config.log_.path = root["log"]["path"].as<std::string>("");
    } catch (const YAML::Exception& e) {
        return Result<void>::Err(origin + ": " + e.what());
    }
    return Result<void>::Ok();
}

void apply_env_overrides(Config& config) {
    std::string hosts = platform::get_env("ZKLOCK_HOSTS");
    if (!hosts.empty()) config.zookeeper_.hosts = parse_hosts(YAML::Node(hosts));

    std::string ns = platform::get_env("ZKLOCK_NAMESPACE");
    if (!ns.empty()) config.zookeeper_.lock_namespace = ns;
}

Result<void> validate(const Config& config) {
    const auto& zk = config.zookeeper_;
    if (!zk.hosts.empty() && zk.lock_namespace.empty())
        return Result<void>::Err("zookeeper.namespace is required when hosts are configured");
    if (zk.lock_namespace.find('/') != std::string::npos)
        return Result<void>::Err("zookeeper.namespace must not contain '/': " + zk.lock_namespace);
    if (zk.session_timeout <= 0 || zk.connect_timeout <= 0)
        return Result<void>::Err("zookeeper timeouts must be positive");
    return Result<void>::Ok();
}

static Result<void> overlay_file(const fs::path& path, Config& config) {
    std::ifstream in(path);
    if (!in) return Result<void>::Err("Cannot read config file: " + path.string());
    std::stringstream buf;
    buf << in.rdbuf();
    return overlay_yaml(buf.str(), path.string(), config);
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

bool project_config_exists(const fs::path& dir) {
    return fs::exists(get_project_config_path(dir));
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".zklock";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / "zklock.yaml";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    fs::create_directories(config_path.parent_path());

    const char* default_config = R"(# zklock configuration
# Project-level settings in ./zklock.yaml override this file.

zookeeper:
  # host:port entries; leave empty to disable migration locking
  hosts: []
  # Locks live under /locks/<namespace>/<key>
  namespace: ""
  session_timeout: 10
  connect_timeout: 15

# Optional: debug log location (default: <tmp>/zklock_debug.log)
# log:
#   path: "/var/log/zklock.log"
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    if (!out) {
        return Result<void>::Err("Failed to write config file at " + config_path.string());
    }
    return Result<void>::Ok();
}

// ── Loaders ────────────────────────────────────────────────────

Result<Config> Config::from_yaml(const std::string& text) {
    Config config;
    auto r = overlay_yaml(text, "<yaml>", config);
    if (r.is_err()) return Result<Config>::Err(r.error);
    auto v = validate(config);
    if (v.is_err()) return Result<Config>::Err(v.error);
    return Result<Config>::Ok(config);
}

Result<Config> Config::load_global() {
    Config config;
    if (global_config_exists()) {
        auto r = overlay_file(get_global_config_path(), config);
        if (r.is_err()) return Result<Config>::Err(r.error);
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::load_project(const fs::path& dir) {
    Config config;
    if (project_config_exists(dir)) {
        auto r = overlay_file(get_project_config_path(dir), config);
        if (r.is_err()) return Result<Config>::Err(r.error);
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::load(const fs::path& project_dir) {
    Config config;
    if (global_config_exists()) {
        auto r = overlay_file(get_global_config_path(), config);
        if (r.is_err()) return Result<Config>::Err(r.error);
    }
    if (project_config_exists(project_dir)) {
        auto r = overlay_file(get_project_config_path(project_dir), config);
        if (r.is_err()) return Result<Config>::Err(r.error);
    }
    apply_env_overrides(config);
    auto v = validate(config);
    if (v.is_err()) return Result<Config>::Err(v.error);
    return Result<Config>::Ok(config);
}

Result<Config> Config::load_file(const fs::path& path) {
    Config config;
    auto r = overlay_file(path, config);
    if (r.is_err()) return Result<Config>::Err(r.error);
    apply_env_overrides(config);
    auto v = validate(config);
    if (v.is_err()) return Result<Config>::Err(v.error);
    return Result<Config>::Ok(config);
}
