#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Outcome of scanning a command line.
struct SanitizeVerdict {
    ErrorKind error = ErrorKind::None;  // None, InjectionAttempt or SubshellAttempt
    std::string reason;
    std::string unquoted;               // text outside quotes, quotes removed

    bool ok() const { return error == ErrorKind::None; }
};

// Single left-to-right pass tracking quote state. Quoted spans are literal
// and never trigger a rejection. An unterminated quote rejects the whole
// line. Runs in time linear in the command length.
SanitizeVerdict sanitize_command(const std::string& command, const ValidationPolicy& policy);

// Split a sanitized command into argv. Quotes delimit literal arguments and
// are removed; adjacent quoted and unquoted text joins into one argument
// ("a"b -> ab). An empty quoted span yields an empty argument.
// Returns an error for unterminated quotes.
Result<std::vector<std::string>> tokenize_command(const std::string& command);
