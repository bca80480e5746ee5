#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <set>
#include <stdexcept>

namespace fs = std::filesystem;

// ── Defaults ──────────────────────────────────────────────────

ValidationPolicy default_policy() {
    ValidationPolicy p;
    p.base_timeout_secs = DEFAULT_BASE_TIMEOUT_SECS;
    p.timeout_ceiling_secs = DEFAULT_TIMEOUT_CEILING_SECS;
    p.max_output_bytes = DEFAULT_MAX_OUTPUT_BYTES;

    // A request is one command line.
    p.blocked_patterns = {"\n", "\r"};

    p.restricted_paths = {
        "/System", "/usr/bin", "/usr/sbin", "/bin", "/sbin", "/etc",
        "/boot", "/proc", "/sys", "/dev",
        "C:\\Windows\\System32", "C:\\Windows\\SysWOW64",
        "C:\\Program Files", "C:\\Program Files (x86)",
    };

    ToolSpec npm;
    npm.program = "npm";
    npm.allowed = {
        "install", "i", "update", "run", "start", "test", "build",
        "lint", "audit", "list", "ls", "outdated", "version",
        "init", "create", "config", "info", "search", "pack",
        "publish", "unpublish", "deprecate", "docs", "repo",
    };
    npm.timeout_multiplier = NPM_TIMEOUT_MULTIPLIER;
    p.tools[ToolCategory::Npm] = npm;

    ToolSpec python;
    python.allowed = {
        "pip", "python", "python3", "pytest", "black", "flake8",
        "mypy", "pylint", "isort", "coverage",
    };
    python.subcommands["pip"] = {"install", "uninstall", "list", "show", "freeze", "check"};
    python.aliases["pip"] = {"python3", "-m", "pip"};
    python.timeout_multiplier = PYTHON_TIMEOUT_MULTIPLIER;
    p.tools[ToolCategory::Python] = python;

    ToolSpec terraform;
    terraform.program = "terraform";
    terraform.allowed = {
        "init", "plan", "apply", "destroy", "validate", "fmt", "output",
        "show", "state", "refresh", "import", "taint", "untaint",
        "workspace", "version", "providers", "graph", "console",
    };
    terraform.timeout_multiplier = TERRAFORM_TIMEOUT_MULTIPLIER;
    p.tools[ToolCategory::Terraform] = terraform;

    ToolSpec git;
    git.program = "git";
    git.allowed = {
        "init", "status", "add", "commit", "log", "diff", "branch",
        "checkout", "switch", "merge", "pull", "push", "fetch", "clone",
        "remote", "stash", "tag", "show", "reset", "restore", "rev-parse",
        "config", "version",
    };
    git.timeout_multiplier = GIT_TIMEOUT_MULTIPLIER;
    p.tools[ToolCategory::Git] = git;

    ToolSpec generic;
    // Read-only utilities. Anything that can run arbitrary code stays out.
    generic.allowed = {
        "echo", "ls", "pwd", "cat", "head", "tail", "wc", "grep",
        "which", "whoami", "date", "tree",
    };
    generic.timeout_multiplier = GENERIC_TIMEOUT_MULTIPLIER;
    p.tools[ToolCategory::Generic] = generic;

    return p;
}

std::string default_config_yaml() {
    return R"(# cmdgate configuration
# Loaded once at startup. Keys left out keep their built-in defaults.

timeouts:
  base_seconds: 60          # deadline = base * tool multiplier
  ceiling_seconds: 3600     # no request runs longer than this

# Per-stream cap on captured stdout/stderr (bytes)
max_output_bytes: 10485760

# Working directories equal to or below these are refused
restricted_paths:
  - /System
  - /usr/bin
  - /usr/sbin
  - /bin
  - /sbin
  - /etc
  - /boot
  - /proc
  - /sys
  - /dev
  - 'C:\Windows\System32'
  - 'C:\Windows\SysWOW64'
  - 'C:\Program Files'
  - 'C:\Program Files (x86)'

# Rejected when found outside quotes, on top of ; & | ` $( ( )
blocked_patterns:
  - "\n"
  - "\r"

# Optional: confine every working directory to this tree
# project_root: /home/me/projects

# Optional: log file (default: <tmp>/cmdgate.log)
# log_file: /var/log/cmdgate.log

tools:
  npm:
    program: npm
    timeout_multiplier: 3
    allowed: [install, i, update, run, start, test, build, lint, audit, list, ls,
              outdated, version, init, create, config, info, search, pack,
              publish, unpublish, deprecate, docs, repo]
  python:
    timeout_multiplier: 2
    allowed: [pip, python, python3, pytest, black, flake8, mypy, pylint, isort, coverage]
    subcommands:
      pip: [install, uninstall, list, show, freeze, check]
    aliases:
      pip: [python3, -m, pip]
  terraform:
    program: terraform
    timeout_multiplier: 10
    allowed: [init, plan, apply, destroy, validate, fmt, output, show, state, refresh,
              import, taint, untaint, workspace, version, providers, graph, console]
  git:
    program: git
    timeout_multiplier: 1
    allowed: [init, status, add, commit, log, diff, branch, checkout, switch, merge,
              pull, push, fetch, clone, remote, stash, tag, show, reset, restore,
              rev-parse, config, version]
  generic:
    timeout_multiplier: 1
    allowed: [echo, ls, pwd, cat, head, tail, wc, grep, which, whoami, date, tree]
)";
}

// ── Paths ─────────────────────────────────────────────────────

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

bool project_config_exists(const fs::path& dir) {
    return fs::exists(get_project_config_path(dir));
}

fs::path get_global_config_dir() {
    return platform::home_dir() / GLOBAL_CONFIG_DIR;
}

fs::path get_global_config_path() {
    return get_global_config_dir() / GLOBAL_CONFIG_FILE;
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / PROJECT_CONFIG_FILE;
}

Result<void> create_default_config(const fs::path& path) {
    // Don't overwrite existing config
    if (fs::exists(path)) {
        return Result<void>::Ok();
    }

    try {
        if (path.has_parent_path()) fs::create_directories(path.parent_path());
        std::ofstream out(path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + path.string());
        }
        out << default_config_yaml();
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

// ── Parsing ───────────────────────────────────────────────────

static std::set<std::string> parse_string_set(const YAML::Node& node) {
    auto items = node.as<std::vector<std::string>>();
    return std::set<std::string>(items.begin(), items.end());
}

static void parse_tool(const YAML::Node& node, ToolSpec& spec) {
    if (node["program"]) spec.program = node["program"].as<std::string>("");
    if (node["timeout_multiplier"]) spec.timeout_multiplier = node["timeout_multiplier"].as<int>();
    if (node["allowed"]) spec.allowed = parse_string_set(node["allowed"]);

    if (node["subcommands"] && node["subcommands"].IsMap()) {
        spec.subcommands.clear();
        for (const auto& kv : node["subcommands"]) {
            spec.subcommands[kv.first.as<std::string>()] = parse_string_set(kv.second);
        }
    }
    if (node["aliases"] && node["aliases"].IsMap()) {
        spec.aliases.clear();
        for (const auto& kv : node["aliases"]) {
            spec.aliases[kv.first.as<std::string>()] = kv.second.as<std::vector<std::string>>();
        }
    }
}

// Overlay a parsed document onto `policy`. Throws on malformed values.
static void overlay_policy(const YAML::Node& root, ValidationPolicy& policy) {
    if (!root || root.IsNull()) return;
    if (!root.IsMap()) {
        throw std::runtime_error("top level must be a mapping");
    }

    if (root["timeouts"]) {
        const auto& t = root["timeouts"];
        if (t["base_seconds"]) policy.base_timeout_secs = t["base_seconds"].as<int>();
        if (t["ceiling_seconds"]) policy.timeout_ceiling_secs = t["ceiling_seconds"].as<int>();
    }
    if (root["max_output_bytes"]) {
        policy.max_output_bytes = root["max_output_bytes"].as<size_t>();
    }
    if (root["restricted_paths"]) {
        policy.restricted_paths = root["restricted_paths"].as<std::vector<std::string>>();
    }
    if (root["blocked_patterns"]) {
        policy.blocked_patterns = root["blocked_patterns"].as<std::vector<std::string>>();
    }
    if (root["project_root"]) {
        std::string project_root = root["project_root"].as<std::string>("");
        if (project_root.empty()) policy.project_root.reset();
        else policy.project_root = fs::path(project_root);
    }
    if (root["log_file"]) {
        policy.log_file = root["log_file"].as<std::string>("");
    }

    if (root["tools"] && root["tools"].IsMap()) {
        for (const auto& kv : root["tools"]) {
            std::string name = kv.first.as<std::string>();
            auto category = parse_category(name);
            if (!category) {
                throw std::runtime_error("unknown tool category '" + name + "'");
            }
            parse_tool(kv.second, policy.tools[*category]);
        }
    }
}

static Result<void> check_policy(const ValidationPolicy& policy) {
    if (policy.base_timeout_secs <= 0) {
        return Result<void>::Err("timeouts.base_seconds must be positive");
    }
    if (policy.timeout_ceiling_secs <= 0) {
        return Result<void>::Err("timeouts.ceiling_seconds must be positive");
    }
    if (policy.timeout_ceiling_secs > MAX_TIMEOUT_SECS) {
        return Result<void>::Err(fmt::format("timeouts.ceiling_seconds must not exceed {}",
                                             MAX_TIMEOUT_SECS));
    }
    if (policy.max_output_bytes == 0) {
        return Result<void>::Err("max_output_bytes must be positive");
    }
    for (const auto& [category, spec] : policy.tools) {
        if (spec.timeout_multiplier <= 0) {
            return Result<void>::Err(fmt::format("tools.{}.timeout_multiplier must be positive",
                                                 category_name(category)));
        }
    }
    return Result<void>::Ok();
}

// Builds a Config from defaults plus a list of YAML documents.
class ConfigBuilder {
public:
    ConfigBuilder() : policy_(default_policy()) {}

    Result<void> overlay(const YAML::Node& root, const std::string& origin) {
        try {
            overlay_policy(root, policy_);
        } catch (const std::exception& e) {
            return Result<void>::Err(fmt::format("Failed to parse {}: {}", origin, e.what()));
        }
        return Result<void>::Ok();
    }

    Result<void> overlay_file(const fs::path& path) {
        YAML::Node root;
        try {
            root = YAML::LoadFile(path.string());
        } catch (const std::exception& e) {
            return Result<void>::Err(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
        auto r = overlay(root, path.string());
        if (r.is_ok()) sources_.push_back(path);
        return r;
    }

    Result<Config> build() {
        auto valid = check_policy(policy_);
        if (valid.is_err()) {
            return Result<Config>::Err("Invalid configuration: " + valid.error);
        }
        Config config;
        config.policy_ = std::make_shared<const ValidationPolicy>(policy_);
        config.sources_ = sources_;
        return Result<Config>::Ok(config);
    }

private:
    ValidationPolicy policy_;
    std::vector<fs::path> sources_;
};

Config Config::defaults() {
    Config config;
    config.policy_ = std::make_shared<const ValidationPolicy>(default_policy());
    return config;
}

Config Config::with_project_root(const fs::path& root) const {
    ValidationPolicy copy = policy_ ? *policy_ : default_policy();
    copy.project_root = root;
    Config config;
    config.policy_ = std::make_shared<const ValidationPolicy>(std::move(copy));
    config.sources_ = sources_;
    return config;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    ConfigBuilder builder;
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
    auto r = builder.overlay(root, "config");
    if (r.is_err()) return Result<Config>::Err(r.error);
    return builder.build();
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }
    ConfigBuilder builder;
    auto r = builder.overlay_file(path);
    if (r.is_err()) return Result<Config>::Err(r.error);
    return builder.build();
}

Result<Config> Config::load_project(const fs::path& dir) {
    if (!project_config_exists(dir)) {
        return Result<Config>::Err("Project config not found at " + get_project_config_path(dir).string());
    }
    return load_file(get_project_config_path(dir));
}

Result<Config> Config::load(const fs::path& project_dir) {
    ConfigBuilder builder;

    // Global first, project overrides
    if (global_config_exists()) {
        auto r = builder.overlay_file(get_global_config_path());
        if (r.is_err()) return Result<Config>::Err(r.error);
    }
    if (project_config_exists(project_dir)) {
        auto r = builder.overlay_file(get_project_config_path(project_dir));
        if (r.is_err()) return Result<Config>::Err(r.error);
    }

    return builder.build();
}
