#include "tool_validator.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

std::string tool_label(ToolCategory category) {
    switch (category) {
        case ToolCategory::Npm:       return "npm command";
        case ToolCategory::Python:    return "Python command";
        case ToolCategory::Terraform: return "Terraform command";
        case ToolCategory::Git:       return "Git command";
        case ToolCategory::Generic:   return "Command";
    }
    return "Command";
}

static std::vector<std::string> sorted_list(const std::set<std::string>& s) {
    return std::vector<std::string>(s.begin(), s.end());
}

ToolVerdict validate_subcommand(const std::string& command, ToolCategory category,
                                const ValidationPolicy& policy) {
    ToolVerdict verdict;

    auto it = policy.tools.find(category);
    if (it == policy.tools.end()) {
        verdict.error = ErrorKind::UnknownCommand;
        verdict.reason = fmt::format("No policy configured for category '{}'", category_name(category));
        return verdict;
    }
    const ToolSpec& spec = it->second;

    auto tokens = split_whitespace(command);
    // "npm install x" and "install x" are the same request
    if (!spec.program.empty() && !tokens.empty() && tokens[0] == spec.program) {
        tokens.erase(tokens.begin());
    }
    if (tokens.empty()) {
        verdict.error = ErrorKind::UnknownCommand;
        verdict.reason = fmt::format("{} is empty", tool_label(category));
        verdict.allowed = sorted_list(spec.allowed);
        return verdict;
    }

    const std::string& first = tokens[0];
    if (!spec.allowed.count(first)) {
        verdict.error = ErrorKind::UnknownCommand;
        verdict.reason = fmt::format("{} not allowed: {}", tool_label(category), first);
        verdict.allowed = sorted_list(spec.allowed);
        return verdict;
    }

    auto sub = spec.subcommands.find(first);
    if (sub != spec.subcommands.end()) {
        std::string second = tokens.size() > 1 ? tokens[1] : "";
        if (!sub->second.count(second)) {
            verdict.error = ErrorKind::UnknownCommand;
            verdict.reason = second.empty()
                ? fmt::format("{} requires a subcommand", first)
                : fmt::format("{} subcommand not allowed: {}", first, second);
            verdict.allowed = sorted_list(sub->second);
            return verdict;
        }
    }

    return verdict;
}

std::vector<std::string> build_argv(const std::vector<std::string>& tokens,
                                    ToolCategory category, const ValidationPolicy& policy) {
    std::vector<std::string> argv;
    auto it = policy.tools.find(category);
    if (it == policy.tools.end()) return tokens;
    const ToolSpec& spec = it->second;

    if (!spec.program.empty()) argv.push_back(spec.program);

    size_t rest = 0;
    if (!spec.program.empty() && !tokens.empty() && tokens[0] == spec.program) {
        rest = 1;
    }
    if (rest < tokens.size()) {
        auto alias = spec.aliases.find(tokens[rest]);
        if (alias != spec.aliases.end() && !alias->second.empty()) {
            argv.insert(argv.end(), alias->second.begin(), alias->second.end());
            rest++;
        }
    }
    argv.insert(argv.end(), tokens.begin() + static_cast<std::ptrdiff_t>(rest), tokens.end());
    return argv;
}
