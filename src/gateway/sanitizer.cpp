#include "sanitizer.hpp"
#include <fmt/format.h>

static constexpr const char* INJECTION_TOKENS[] = {";", "&", "|", "`"};
static constexpr const char* SUBSHELL_TOKENS[] = {"$(", "(", ")"};

static std::string printable(const std::string& token) {
    if (token == "\n") return "\\n";
    if (token == "\r") return "\\r";
    return token;
}

SanitizeVerdict sanitize_command(const std::string& command, const ValidationPolicy& policy) {
    SanitizeVerdict verdict;
    verdict.unquoted.reserve(command.size());

    char quote = 0;
    for (char c : command) {
        if (quote) {
            if (c == quote) quote = 0;
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
            continue;
        }
        verdict.unquoted.push_back(c);
    }

    if (quote) {
        verdict.error = ErrorKind::InjectionAttempt;
        verdict.reason = fmt::format("Unbalanced {} quote in command", quote == '"' ? "double" : "single");
        verdict.unquoted.clear();
        return verdict;
    }

    for (const char* token : INJECTION_TOKENS) {
        if (verdict.unquoted.find(token) != std::string::npos) {
            verdict.error = ErrorKind::InjectionAttempt;
            verdict.reason = fmt::format("Unquoted shell operator '{}' is not allowed", token);
            return verdict;
        }
    }

    for (const char* token : SUBSHELL_TOKENS) {
        if (verdict.unquoted.find(token) != std::string::npos) {
            verdict.error = ErrorKind::SubshellAttempt;
            verdict.reason = fmt::format("Unquoted subshell marker '{}' is not allowed", token);
            return verdict;
        }
    }

    for (const auto& pattern : policy.blocked_patterns) {
        if (!pattern.empty() && verdict.unquoted.find(pattern) != std::string::npos) {
            verdict.error = ErrorKind::InjectionAttempt;
            verdict.reason = fmt::format("Blocked pattern '{}' in command", printable(pattern));
            return verdict;
        }
    }

    return verdict;
}

Result<std::vector<std::string>> tokenize_command(const std::string& command) {
    std::vector<std::string> args;
    std::string current;
    bool have_token = false;
    char quote = 0;

    for (char c : command) {
        if (quote) {
            if (c == quote) quote = 0;
            else current.push_back(c);
            continue;
        }
        switch (c) {
            case '"':
            case '\'':
                quote = c;
                have_token = true;
                break;
            case ' ':
            case '\t':
            case '\n':
            case '\r':
                if (have_token) {
                    args.push_back(std::move(current));
                    current.clear();
                    have_token = false;
                }
                break;
            default:
                current.push_back(c);
                have_token = true;
        }
    }

    if (quote) {
        return Result<std::vector<std::string>>::Err("Unbalanced quote in command");
    }
    if (have_token) args.push_back(std::move(current));
    return Result<std::vector<std::string>>::Ok(std::move(args));
}
