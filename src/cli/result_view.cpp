#include "result_view.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <gateway/result_reporter.hpp>
#include <iostream>
#include <sstream>

static void print_block(const std::string& text) {
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        std::cout << "    " << line << "\n";
    }
}

void print_result(const ExecutionResult& r, OutputFormat format) {
    if (format == OutputFormat::Yaml) {
        std::cout << format_result_yaml(r);
        return;
    }

    if (!r.stdout_data.empty()) print_block(r.stdout_data);
    if (!r.stderr_data.empty()) {
        std::cout << theme::color::DIM;
        print_block(r.stderr_data);
        std::cout << theme::color::RESET;
    }

    std::string summary = r.command.empty() ? outcome_name(r) : join_args(r.command);
    if (r.success) {
        std::cout << theme::ok(summary + theme::dim("  " + format_elapsed(r.duration_ms)));
        if (!r.message.empty()) {
            std::cout << theme::info(r.message);
        }
        return;
    }

    std::cout << theme::fail(std::string(error_kind_name(r.error)) + ": " + r.message);
    if (!r.allowed_commands.empty()) {
        std::cout << theme::step("Allowed: " + join_args(r.allowed_commands));
    }
    if (r.error == ErrorKind::ToolFailure || r.error == ErrorKind::TimedOut) {
        std::cout << theme::kv("exit code", std::to_string(r.exit_code));
        std::cout << theme::kv("duration", format_elapsed(r.duration_ms));
    }
}

int exit_status_for(const ExecutionResult& r) {
    switch (r.error) {
        case ErrorKind::None:        return 0;
        case ErrorKind::ToolFailure: return r.exit_code > 0 ? r.exit_code : 1;
        case ErrorKind::TimedOut:    return EXIT_TIMED_OUT;
        case ErrorKind::SpawnError:  return EXIT_SPAWN_ERROR;
        default:                     return EXIT_REJECTED;
    }
}

void print_policy(const ValidationPolicy& policy) {
    std::cout << theme::section("Timeouts");
    std::cout << theme::kv("base", std::to_string(policy.base_timeout_secs) + "s");
    std::cout << theme::kv("ceiling", std::to_string(policy.timeout_ceiling_secs) + "s");
    std::cout << theme::kv("max output", std::to_string(policy.max_output_bytes) + " bytes");

    std::cout << theme::section("Tools");
    for (const auto& [category, spec] : policy.tools) {
        std::string head = std::string(category_name(category)) + "  "
            + theme::dim(fmt::format("x{} = {}s", spec.timeout_multiplier,
                                     policy.timeout_for(category)));
        std::cout << theme::step(head);
        std::vector<std::string> allowed(spec.allowed.begin(), spec.allowed.end());
        std::cout << "      " << theme::dim(join_args(allowed)) << "\n";
        for (const auto& [first, subs] : spec.subcommands) {
            std::vector<std::string> list(subs.begin(), subs.end());
            std::cout << "      " << theme::dim(first + ": " + join_args(list)) << "\n";
        }
    }

    std::cout << theme::section("Paths");
    std::cout << theme::kv("project root",
                           policy.project_root ? policy.project_root->string() : std::string("-"));
    for (const auto& p : policy.restricted_paths) {
        std::cout << theme::kv("restricted", p);
    }
    std::cout << "\n";
}
