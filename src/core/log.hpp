#pragma once

#include <string>
#include <core/types.hpp>

// Path of the gateway log. Defaults to <tmp>/cmdgate.log until set_log_path().
std::string gate_log_path();
void set_log_path(const std::string& path);

// Append a timestamped line to the gateway log. Safe to call from any thread.
void gate_log(const std::string& msg);

// One summary line per finished request, plus stderr excerpt on failure.
void gate_log_result(const std::string& label, const CommandRequest& req,
                     const ExecutionResult& r);
