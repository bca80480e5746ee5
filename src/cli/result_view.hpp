#pragma once

#include <string>
#include <core/types.hpp>

enum class OutputFormat { Text, Yaml };

// Print a result for a terminal user (Text) or a program (Yaml).
void print_result(const ExecutionResult& r, OutputFormat format);

// Exit status for a one-shot invocation: the tool's own code when it ran,
// 124 on timeout, 127 when it could not start, 1 when rejected.
int exit_status_for(const ExecutionResult& r);

// Print the effective policy.
void print_policy(const ValidationPolicy& policy);
