#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

struct ToolVerdict {
    ErrorKind error = ErrorKind::None;   // None or UnknownCommand
    std::string reason;
    std::vector<std::string> allowed;    // allowlist that rejected the command

    bool ok() const { return error == ErrorKind::None; }
};

// Check the first (and, for tools with nested allowlists such as pip, the
// second) whitespace-delimited token against the category's allowlist.
// A leading token equal to the category's program is skipped, so
// "npm install" and "install" validate alike.
// Cheap and categorical, so it runs before the sanitizer.
ToolVerdict validate_subcommand(const std::string& command, ToolCategory category,
                                const ValidationPolicy& policy);

// Turn tokenized arguments into the argv to execute: prepend the
// category's program (npm, git, terraform) unless the caller already
// wrote it, and apply aliases (pip -> python3 -m pip).
std::vector<std::string> build_argv(const std::vector<std::string>& tokens,
                                    ToolCategory category, const ValidationPolicy& policy);

// Label used in rejection messages ("npm command not allowed: x").
std::string tool_label(ToolCategory category);
