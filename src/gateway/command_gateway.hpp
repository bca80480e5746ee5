#pragma once

#include <string>
#include <memory>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include "execution_engine.hpp"

// Entry point for every command request. Order of checks:
// allowlist -> sanitizer -> path guard -> execution. Every path, including
// internal faults, ends in exactly one ExecutionResult.
class CommandGateway {
public:
    explicit CommandGateway(std::shared_ptr<const ValidationPolicy> policy);

    ExecutionResult execute(const CommandRequest& req) const;

    // All checks, no execution. success=true means the request would run.
    ExecutionResult validate(const CommandRequest& req) const;

    // One entry point per tool category, as exposed to remote callers.
    ExecutionResult run_npm(const std::string& command, const std::string& cwd = ".",
                            const std::optional<std::string>& input = std::nullopt) const;
    ExecutionResult run_python(const std::string& command, const std::string& cwd = ".",
                               const std::optional<std::string>& input = std::nullopt) const;
    ExecutionResult run_terraform(const std::string& command, const std::string& cwd = ".",
                                  const std::optional<std::string>& input = std::nullopt) const;
    ExecutionResult run_git(const std::string& command, const std::string& cwd = ".",
                            const std::optional<std::string>& input = std::nullopt) const;
    ExecutionResult run_command(const std::string& command, const std::string& cwd = ".",
                                const std::optional<std::string>& input = std::nullopt) const;

    const ValidationPolicy& policy() const { return *policy_; }

private:
    struct Approval {
        bool approved = false;
        ExecutionResult rejection;   // set when !approved
        ExecutionPlan plan;          // set when approved
    };

    Approval approve(const CommandRequest& req) const;
    ExecutionResult run_category(ToolCategory category, const std::string& command,
                                 const std::string& cwd,
                                 const std::optional<std::string>& input) const;

    std::shared_ptr<const ValidationPolicy> policy_;
    ExecutionEngine engine_;
};

// Per-caller ambient directory. `cd` moves the session, never the process.
// A Session belongs to one logical caller; share the gateway, not sessions.
class Session {
public:
    explicit Session(const CommandGateway& gateway,
                     std::filesystem::path start_dir = std::filesystem::path());

    const std::filesystem::path& cwd() const { return cwd_; }

    // Resolve `target` against the session directory, run it through the
    // path guard and require an existing directory before moving.
    Result<std::filesystem::path> change_directory(const std::string& target);

    CommandRequest make_request(ToolCategory category, const std::string& command,
                                const std::optional<std::string>& input = std::nullopt) const;

    ExecutionResult run(ToolCategory category, const std::string& command,
                        const std::optional<std::string>& input = std::nullopt) const;
    ExecutionResult check(ToolCategory category, const std::string& command) const;

private:
    const CommandGateway& gateway_;
    std::filesystem::path cwd_;
};
