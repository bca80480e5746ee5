#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <set>
#include <filesystem>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// ── Tool categories ─────────────────────────────────────────

enum class ToolCategory {
    Npm,        // package manager
    Python,     // language runtime
    Terraform,  // infra-as-code
    Git,        // version control
    Generic,
};

constexpr ToolCategory ALL_CATEGORIES[] = {
    ToolCategory::Npm, ToolCategory::Python, ToolCategory::Terraform,
    ToolCategory::Git, ToolCategory::Generic,
};

// Lowercase name used in configuration and on the command line.
const char* category_name(ToolCategory category);
std::optional<ToolCategory> parse_category(const std::string& name);

// ── Outcomes ────────────────────────────────────────────────

enum class ErrorKind {
    None,
    UnknownCommand,
    InjectionAttempt,
    SubshellAttempt,
    PathRestricted,
    PathTraversal,
    SpawnError,
    TimedOut,
    ToolFailure,        // process ran, exited nonzero
};

const char* error_kind_name(ErrorKind kind);

// One caller request. Built once, never modified afterwards.
struct CommandRequest {
    std::string command;
    std::optional<std::filesystem::path> working_directory;  // defaults to process cwd
    std::optional<std::string> input;                        // stdin content
    ToolCategory category = ToolCategory::Generic;
    std::optional<int> timeout_secs;                         // overrides the base timeout
};

// Uniform outcome of one request, produced on every path through the gateway.
struct ExecutionResult {
    bool success = false;
    std::string stdout_data;
    std::string stderr_data;
    int exit_code = -1;
    ErrorKind error = ErrorKind::None;
    std::string message;
    int64_t duration_ms = 0;

    std::vector<std::string> command;           // argv actually executed
    std::string working_directory;              // normalized directory used
    std::vector<std::string> allowed_commands;  // set on UnknownCommand

    bool rejected() const {
        return error != ErrorKind::None && error != ErrorKind::ToolFailure &&
               error != ErrorKind::TimedOut && error != ErrorKind::SpawnError;
    }
};

// ── Policy ──────────────────────────────────────────────────

struct ToolSpec {
    std::string program;                                      // argv[0]; empty: first token is the program
    std::set<std::string> allowed;                            // first-token allowlist
    std::map<std::string, std::set<std::string>> subcommands; // second-token allowlists
    std::map<std::string, std::vector<std::string>> aliases;  // first token -> argv prefix
    int timeout_multiplier = 1;
};

struct ValidationPolicy {
    std::map<ToolCategory, ToolSpec> tools;
    std::vector<std::string> blocked_patterns;   // on top of ; & | ` $( ( )
    std::vector<std::string> restricted_paths;
    std::optional<std::filesystem::path> project_root;
    int base_timeout_secs = 60;
    int timeout_ceiling_secs = 3600;
    size_t max_output_bytes = 10 * 1024 * 1024;
    std::string log_file;

    const ToolSpec& tool(ToolCategory category) const { return tools.at(category); }

    // Deadline for a request: base (or caller override) times the category
    // multiplier, clamped to the hard ceiling and to MAX_TIMEOUT_SECS.
    int timeout_for(ToolCategory category, std::optional<int> override_secs = std::nullopt) const;
};
