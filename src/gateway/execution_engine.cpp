#include "execution_engine.hpp"
#include "result_reporter.hpp"
#include <platform/process.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

ExecutionEngine::ExecutionEngine(std::shared_ptr<const ValidationPolicy> policy)
    : policy_(std::move(policy)) {}

ExecutionResult ExecutionEngine::run(const ExecutionPlan& plan) const {
    std::string cwd = plan.working_dir.string();
    if (plan.argv.empty()) {
        return make_spawn_error("empty command", plan.argv, cwd);
    }

    platform::SpawnOptions opts;
    opts.program = plan.argv[0];
    opts.args.assign(plan.argv.begin() + 1, plan.argv.end());
    opts.working_dir = plan.working_dir;

    auto spawned = platform::spawn(opts);
    if (spawned.is_err()) {
        gate_log(fmt::format("spawn failed: {} ({})", join_args(plan.argv), spawned.error));
        return make_spawn_error(spawned.error, plan.argv, cwd);
    }

    platform::CaptureLimits limits;
    limits.timeout_ms = plan.timeout_ms;
    limits.max_output_bytes = policy_->max_output_bytes;

    auto run = platform::run_captured(spawned.value, plan.input, limits);
    if (run.timed_out) {
        gate_log(fmt::format("deadline {}ms reached, process tree terminated: {}",
                             plan.timeout_ms, join_args(plan.argv)));
    }
    return make_from_run(run, plan.argv, cwd, plan.timeout_ms);
}
