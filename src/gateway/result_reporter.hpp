#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <platform/process.hpp>

// Terminal state of a request, derived from its result.
// "Rejected", "Completed", "TimedOut" or "SpawnError".
std::string outcome_name(const ExecutionResult& r);

ExecutionResult make_rejection(ErrorKind kind, const std::string& reason,
                               std::vector<std::string> allowed = {});

ExecutionResult make_spawn_error(const std::string& reason, const std::vector<std::string>& argv,
                                 const std::string& working_dir);

// Completed (success or ToolFailure) or TimedOut, with whatever was captured.
ExecutionResult make_from_run(const platform::CapturedRun& run, const std::vector<std::string>& argv,
                              const std::string& working_dir, int timeout_ms);

// Block-style YAML document of every field, for machine consumers.
std::string format_result_yaml(const ExecutionResult& r);
