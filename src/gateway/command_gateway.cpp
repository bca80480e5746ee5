#include "command_gateway.hpp"
#include "sanitizer.hpp"
#include "tool_validator.hpp"
#include "path_guard.hpp"
#include "result_reporter.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <atomic>
#include <system_error>

namespace fs = std::filesystem;

static std::string next_label() {
    static std::atomic<uint64_t> counter{0};
    return fmt::format("req#{}", ++counter);
}

CommandGateway::CommandGateway(std::shared_ptr<const ValidationPolicy> policy)
    : policy_(std::move(policy)), engine_(policy_) {}

CommandGateway::Approval CommandGateway::approve(const CommandRequest& req) const {
    Approval a;
    std::string requested_dir = req.working_directory ? req.working_directory->string() : "";

    // 1. Allowlist
    auto tool = validate_subcommand(req.command, req.category, *policy_);
    if (!tool.ok()) {
        a.rejection = make_rejection(tool.error, tool.reason, tool.allowed);
        a.rejection.working_directory = requested_dir;
        return a;
    }

    // 2. Quote-aware metacharacter scan
    auto verdict = sanitize_command(req.command, *policy_);
    if (!verdict.ok()) {
        a.rejection = make_rejection(verdict.error, verdict.reason);
        a.rejection.working_directory = requested_dir;
        return a;
    }

    // 3. Working directory
    auto path = check_working_directory(requested_dir, platform::current_dir(), *policy_,
                                        policy_->project_root);
    if (!path.ok()) {
        a.rejection = make_rejection(path.error, "Working directory blocked: " + path.reason);
        a.rejection.working_directory = requested_dir;
        return a;
    }

    auto tokens = tokenize_command(req.command);
    if (tokens.is_err()) {
        // sanitize_command already rejects unbalanced quotes
        a.rejection = make_rejection(ErrorKind::InjectionAttempt, tokens.error);
        return a;
    }

    a.approved = true;
    a.plan.argv = build_argv(tokens.value, req.category, *policy_);
    a.plan.working_dir = path.resolved;
    a.plan.input = req.input;
    a.plan.timeout_ms = policy_->timeout_for(req.category, req.timeout_secs) * 1000;
    return a;
}

ExecutionResult CommandGateway::execute(const CommandRequest& req) const {
    std::string label = next_label();
    ExecutionResult result;
    try {
        Approval a = approve(req);
        if (!a.approved) {
            result = std::move(a.rejection);
        } else {
            std::string cwd = a.plan.working_dir.string();
            std::error_code ec;
            if (!fs::is_directory(a.plan.working_dir, ec)) {
                result = make_spawn_error("Working directory does not exist: " + cwd,
                                          a.plan.argv, cwd);
            } else {
                result = engine_.run(a.plan);
            }
        }
    } catch (const std::exception& e) {
        result = make_spawn_error(e.what(), {}, "");
    }
    gate_log_result(label, req, result);
    return result;
}

ExecutionResult CommandGateway::validate(const CommandRequest& req) const {
    try {
        Approval a = approve(req);
        if (!a.approved) return a.rejection;

        ExecutionResult r;
        r.success = true;
        r.exit_code = 0;
        r.command = a.plan.argv;
        r.working_directory = a.plan.working_dir.string();
        r.message = fmt::format("Approved, timeout {}s", a.plan.timeout_ms / 1000);
        return r;
    } catch (const std::exception& e) {
        return make_spawn_error(e.what(), {}, "");
    }
}

ExecutionResult CommandGateway::run_category(ToolCategory category, const std::string& command,
                                             const std::string& cwd,
                                             const std::optional<std::string>& input) const {
    CommandRequest req;
    req.command = command;
    req.category = category;
    if (!cwd.empty()) req.working_directory = fs::path(cwd);
    req.input = input;
    return execute(req);
}

ExecutionResult CommandGateway::run_npm(const std::string& command, const std::string& cwd,
                                        const std::optional<std::string>& input) const {
    return run_category(ToolCategory::Npm, command, cwd, input);
}

ExecutionResult CommandGateway::run_python(const std::string& command, const std::string& cwd,
                                           const std::optional<std::string>& input) const {
    return run_category(ToolCategory::Python, command, cwd, input);
}

ExecutionResult CommandGateway::run_terraform(const std::string& command, const std::string& cwd,
                                              const std::optional<std::string>& input) const {
    return run_category(ToolCategory::Terraform, command, cwd, input);
}

ExecutionResult CommandGateway::run_git(const std::string& command, const std::string& cwd,
                                        const std::optional<std::string>& input) const {
    return run_category(ToolCategory::Git, command, cwd, input);
}

ExecutionResult CommandGateway::run_command(const std::string& command, const std::string& cwd,
                                            const std::optional<std::string>& input) const {
    return run_category(ToolCategory::Generic, command, cwd, input);
}

// ── Session ──────────────────────────────────────────────────

Session::Session(const CommandGateway& gateway, fs::path start_dir)
    : gateway_(gateway),
      cwd_(start_dir.empty() ? platform::current_dir() : std::move(start_dir)) {}

Result<fs::path> Session::change_directory(const std::string& target) {
    std::string dest = target;
    trim(dest);
    if (dest.empty() || dest == "~") {
        dest = platform::home_dir().string();
    } else if (dest.rfind("~/", 0) == 0) {
        dest = (platform::home_dir() / dest.substr(2)).string();
    }

    const auto& policy = gateway_.policy();
    auto verdict = check_working_directory(dest, cwd_, policy, policy.project_root);
    if (!verdict.ok()) {
        return Result<fs::path>::Err(fmt::format("{}: {}", error_kind_name(verdict.error),
                                                 verdict.reason));
    }

    std::error_code ec;
    if (!fs::is_directory(verdict.resolved, ec)) {
        return Result<fs::path>::Err("No such directory: " + verdict.resolved.string());
    }

    cwd_ = verdict.resolved;
    gate_log(fmt::format("session cd -> {}", cwd_.string()));
    return Result<fs::path>::Ok(cwd_);
}

CommandRequest Session::make_request(ToolCategory category, const std::string& command,
                                     const std::optional<std::string>& input) const {
    CommandRequest req;
    req.command = command;
    req.category = category;
    req.working_directory = cwd_;
    req.input = input;
    return req;
}

ExecutionResult Session::run(ToolCategory category, const std::string& command,
                             const std::optional<std::string>& input) const {
    return gateway_.execute(make_request(category, command, input));
}

ExecutionResult Session::check(ToolCategory category, const std::string& command) const {
    return gateway_.validate(make_request(category, command));
}
