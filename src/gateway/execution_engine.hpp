#pragma once

#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <filesystem>
#include <core/types.hpp>

// A request that passed the allowlist, the sanitizer and the path guard.
struct ExecutionPlan {
    std::vector<std::string> argv;
    std::filesystem::path working_dir;
    std::optional<std::string> input;
    int timeout_ms = 0;
};

// Runs approved plans. Holds only the shared read-only policy, so one
// engine serves any number of concurrent callers.
class ExecutionEngine {
public:
    explicit ExecutionEngine(std::shared_ptr<const ValidationPolicy> policy);

    // Blocks until the process exits or the deadline passes. Never throws
    // for process-level failures; they come back as SpawnError.
    ExecutionResult run(const ExecutionPlan& plan) const;

private:
    std::shared_ptr<const ValidationPolicy> policy_;
};
