#include "result_reporter.hpp"
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

std::string outcome_name(const ExecutionResult& r) {
    switch (r.error) {
        case ErrorKind::None:
        case ErrorKind::ToolFailure:
            return "Completed";
        case ErrorKind::TimedOut:
            return "TimedOut";
        case ErrorKind::SpawnError:
            return "SpawnError";
        default:
            return "Rejected";
    }
}

ExecutionResult make_rejection(ErrorKind kind, const std::string& reason,
                               std::vector<std::string> allowed) {
    ExecutionResult r;
    r.success = false;
    r.error = kind;
    r.message = reason;
    r.allowed_commands = std::move(allowed);
    return r;
}

ExecutionResult make_spawn_error(const std::string& reason, const std::vector<std::string>& argv,
                                 const std::string& working_dir) {
    ExecutionResult r;
    r.success = false;
    r.error = ErrorKind::SpawnError;
    r.message = "Failed to start process: " + reason;
    r.command = argv;
    r.working_directory = working_dir;
    return r;
}

ExecutionResult make_from_run(const platform::CapturedRun& run, const std::vector<std::string>& argv,
                              const std::string& working_dir, int timeout_ms) {
    ExecutionResult r;
    r.stdout_data = run.stdout_data;
    r.stderr_data = run.stderr_data;
    r.exit_code = run.exit_code;
    r.duration_ms = run.duration_ms;
    r.command = argv;
    r.working_directory = working_dir;

    if (run.timed_out) {
        r.success = false;
        r.error = ErrorKind::TimedOut;
        r.message = fmt::format("{} timed out after {}", argv.empty() ? "command" : argv[0],
                                format_elapsed(timeout_ms));
    } else if (run.exit_code != 0) {
        r.success = false;
        r.error = ErrorKind::ToolFailure;
        r.message = fmt::format("{} exited with code {}", join_args(argv), run.exit_code);
    } else {
        r.success = true;
        r.error = ErrorKind::None;
    }

    if (run.stdout_truncated || run.stderr_truncated) {
        std::string note = fmt::format("output truncated ({}{}{})",
                                       run.stdout_truncated ? "stdout" : "",
                                       run.stdout_truncated && run.stderr_truncated ? ", " : "",
                                       run.stderr_truncated ? "stderr" : "");
        r.message = r.message.empty() ? note : r.message + "; " + note;
    }
    return r;
}

static void emit_text(YAML::Emitter& out, const std::string& text) {
    if (text.find('\n') != std::string::npos) out << YAML::Literal;
    out << text;
}

std::string format_result_yaml(const ExecutionResult& r) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "outcome" << YAML::Value << outcome_name(r);
    out << YAML::Key << "success" << YAML::Value << r.success;
    out << YAML::Key << "exit_code" << YAML::Value << r.exit_code;
    out << YAML::Key << "error" << YAML::Value << error_kind_name(r.error);
    out << YAML::Key << "message" << YAML::Value << r.message;
    out << YAML::Key << "duration_ms" << YAML::Value << r.duration_ms;
    out << YAML::Key << "command" << YAML::Value << YAML::Flow << r.command;
    out << YAML::Key << "working_directory" << YAML::Value << r.working_directory;
    if (!r.allowed_commands.empty()) {
        out << YAML::Key << "allowed_commands" << YAML::Value << YAML::Flow << r.allowed_commands;
    }
    out << YAML::Key << "stdout" << YAML::Value;
    emit_text(out, r.stdout_data);
    out << YAML::Key << "stderr" << YAML::Value;
    emit_text(out, r.stderr_data);
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}
