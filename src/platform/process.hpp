#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <cstdint>
#include <core/types.hpp>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#endif

namespace platform {

struct SpawnOptions {
    std::string program;                  // resolved through PATH
    std::vector<std::string> args;        // argv[1..]
    std::filesystem::path working_dir;    // empty: inherit
};

// Handle to a spawned child process. On Unix the child leads its own process
// group; on Windows it is placed in a job object. Either way terminate()
// takes down everything the child started.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // True if the process is still running. Reaps it on exit.
    bool running();

    // Wait for the process to exit. Returns exit code (128+signal when killed).
    // timeout_ms = -1 means indefinite wait; returns -1 on timeout.
    int wait(int timeout_ms = -1);

    // Terminate the whole process tree: SIGTERM to the group, a grace period,
    // then SIGKILL (TerminateJobObject on Windows).
    void terminate();

    // Kill whatever is left of the tree after the leader has exited.
    void kill_remaining();

    bool exited() const { return exited_; }
    int exit_code() const { return exit_code_; }

#ifdef _WIN32
    HANDLE native_handle() const { return handle_; }
    HANDLE stdin_pipe() const { return stdin_; }
    HANDLE stdout_pipe() const { return stdout_; }
    HANDLE stderr_pipe() const { return stderr_; }
    void close_stdin();
#else
    int native_handle() const { return pid_; }
    int stdin_fd() const { return stdin_fd_; }
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }
    void close_stdin();
    void close_stdout();
    void close_stderr();
#endif

private:
    void release();
    void record_exit(int status);

#ifdef _WIN32
    HANDLE handle_ = INVALID_HANDLE_VALUE;
    HANDLE thread_ = INVALID_HANDLE_VALUE;
    HANDLE job_ = nullptr;
    HANDLE stdin_ = INVALID_HANDLE_VALUE;
    HANDLE stdout_ = INVALID_HANDLE_VALUE;
    HANDLE stderr_ = INVALID_HANDLE_VALUE;
#else
    int pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
#endif
    bool exited_ = false;
    int exit_code_ = -1;

    friend Result<ProcessHandle> spawn(const SpawnOptions& opts);
};

// Spawn a child with stdin, stdout and stderr connected to pipes.
// Fails when the working directory cannot be entered or the program
// cannot be executed; the error text carries the OS reason.
Result<ProcessHandle> spawn(const SpawnOptions& opts);

struct CaptureLimits {
    int timeout_ms = -1;                     // -1: no deadline
    size_t max_output_bytes = 10 * 1024 * 1024;
};

struct CapturedRun {
    bool timed_out = false;
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    int64_t duration_ms = 0;
};

// Feed `input` to the child, collect its output until it exits or the
// deadline passes. On timeout the tree is terminated and nothing read
// after that point is kept.
CapturedRun run_captured(ProcessHandle& proc, const std::optional<std::string>& input,
                         const CaptureLimits& limits);

} // namespace platform
