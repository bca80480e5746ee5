#include "process.hpp"
#include "platform.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>

#ifdef _WIN32
#  include <windows.h>
#  include <thread>
#  include <atomic>
#else
#  include <unistd.h>
#  include <sys/wait.h>
#  include <signal.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <cerrno>
#  include <cstring>
#endif

#include <algorithm>
#include <chrono>
#include <mutex>

namespace platform {

using Clock = std::chrono::steady_clock;

static int64_t elapsed_ms(Clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since).count();
}

static void append_capped(std::string& dst, bool& truncated, const char* data,
                          size_t n, size_t cap) {
    size_t room = cap > dst.size() ? cap - dst.size() : 0;
    if (n > room) {
        truncated = true;
        n = room;
    }
    dst.append(data, n);
}

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    release();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    *this = std::move(other);
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        release();
#ifdef _WIN32
        handle_ = other.handle_;
        thread_ = other.thread_;
        job_ = other.job_;
        stdin_ = other.stdin_;
        stdout_ = other.stdout_;
        stderr_ = other.stderr_;
        other.handle_ = INVALID_HANDLE_VALUE;
        other.thread_ = INVALID_HANDLE_VALUE;
        other.job_ = nullptr;
        other.stdin_ = INVALID_HANDLE_VALUE;
        other.stdout_ = INVALID_HANDLE_VALUE;
        other.stderr_ = INVALID_HANDLE_VALUE;
#else
        pid_ = other.pid_;
        stdin_fd_ = other.stdin_fd_;
        stdout_fd_ = other.stdout_fd_;
        stderr_fd_ = other.stderr_fd_;
        other.pid_ = -1;
        other.stdin_fd_ = -1;
        other.stdout_fd_ = -1;
        other.stderr_fd_ = -1;
#endif
        exited_ = other.exited_;
        exit_code_ = other.exit_code_;
        other.exited_ = false;
        other.exit_code_ = -1;
    }
    return *this;
}

#ifdef _WIN32

// ── Windows: job objects ────────────────────────────────────

static void close_handle(HANDLE& h) {
    if (h != INVALID_HANDLE_VALUE && h != nullptr) CloseHandle(h);
    h = INVALID_HANDLE_VALUE;
}

static std::string last_error_text(DWORD code) {
    char* buf = nullptr;
    DWORD len = FormatMessageA(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM |
                               FORMAT_MESSAGE_IGNORE_INSERTS,
                               nullptr, code, 0, reinterpret_cast<LPSTR>(&buf), 0, nullptr);
    std::string text = (len && buf) ? std::string(buf, len) : fmt::format("error {}", code);
    if (buf) LocalFree(buf);
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) text.pop_back();
    return text;
}

void ProcessHandle::release() {
    if (valid() && !exited_ && job_) TerminateJobObject(job_, 1);
    close_handle(stdin_);
    close_handle(stdout_);
    close_handle(stderr_);
    close_handle(handle_);
    close_handle(thread_);
    if (job_) CloseHandle(job_);
    job_ = nullptr;
}

void ProcessHandle::record_exit(int status) {
    exited_ = true;
    exit_code_ = status;
}

bool ProcessHandle::valid() const {
    return handle_ != INVALID_HANDLE_VALUE;
}

bool ProcessHandle::running() {
    if (handle_ == INVALID_HANDLE_VALUE || exited_) return false;
    if (WaitForSingleObject(handle_, 0) != WAIT_OBJECT_0) return true;
    DWORD code = 1;
    GetExitCodeProcess(handle_, &code);
    record_exit(static_cast<int>(code));
    return false;
}

int ProcessHandle::wait(int timeout_ms) {
    if (handle_ == INVALID_HANDLE_VALUE) return -1;
    if (exited_) return exit_code_;
    DWORD ms = (timeout_ms < 0) ? INFINITE : static_cast<DWORD>(timeout_ms);
    if (WaitForSingleObject(handle_, ms) != WAIT_OBJECT_0) return -1;
    DWORD code = 1;
    GetExitCodeProcess(handle_, &code);
    record_exit(static_cast<int>(code));
    return exit_code_;
}

void ProcessHandle::terminate() {
    if (handle_ == INVALID_HANDLE_VALUE) return;
    if (job_) TerminateJobObject(job_, 1);
    else TerminateProcess(handle_, 1);
    wait(TERMINATE_GRACE_MS);
}

void ProcessHandle::kill_remaining() {
    if (job_) TerminateJobObject(job_, 1);
}

void ProcessHandle::close_stdin() {
    close_handle(stdin_);
}

// Quote one argument per the MSVC runtime's CommandLineToArgv rules.
static std::string quote_windows_arg(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string::npos) return arg;
    std::string out = "\"";
    for (auto it = arg.begin();; ++it) {
        size_t backslashes = 0;
        while (it != arg.end() && *it == '\\') {
            ++it;
            ++backslashes;
        }
        if (it == arg.end()) {
            out.append(backslashes * 2, '\\');
            break;
        } else if (*it == '"') {
            out.append(backslashes * 2 + 1, '\\');
            out.push_back(*it);
        } else {
            out.append(backslashes, '\\');
            out.push_back(*it);
        }
    }
    out.push_back('"');
    return out;
}

Result<ProcessHandle> spawn(const SpawnOptions& opts) {
    SECURITY_ATTRIBUTES sa = {};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE in_r = INVALID_HANDLE_VALUE, in_w = INVALID_HANDLE_VALUE;
    HANDLE out_r = INVALID_HANDLE_VALUE, out_w = INVALID_HANDLE_VALUE;
    HANDLE err_r = INVALID_HANDLE_VALUE, err_w = INVALID_HANDLE_VALUE;
    auto close_all = [&]() {
        close_handle(in_r); close_handle(in_w);
        close_handle(out_r); close_handle(out_w);
        close_handle(err_r); close_handle(err_w);
    };

    if (!CreatePipe(&in_r, &in_w, &sa, 0) || !CreatePipe(&out_r, &out_w, &sa, 0) ||
        !CreatePipe(&err_r, &err_w, &sa, 0)) {
        std::string err = last_error_text(GetLastError());
        close_all();
        return Result<ProcessHandle>::Err("cannot create pipes: " + err);
    }
    SetHandleInformation(in_w, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(out_r, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(err_r, HANDLE_FLAG_INHERIT, 0);

    HANDLE job = CreateJobObjectA(nullptr, nullptr);
    if (!job) {
        std::string err = last_error_text(GetLastError());
        close_all();
        return Result<ProcessHandle>::Err("cannot create job object: " + err);
    }
    JOBOBJECT_EXTENDED_LIMIT_INFORMATION limits = {};
    limits.BasicLimitInformation.LimitFlags = JOB_OBJECT_LIMIT_KILL_ON_JOB_CLOSE;
    SetInformationJobObject(job, JobObjectExtendedLimitInformation, &limits, sizeof(limits));

    std::string cmd_str = quote_windows_arg(opts.program);
    for (const auto& arg : opts.args) {
        cmd_str += " " + quote_windows_arg(arg);
    }
    std::string cwd = opts.working_dir.string();

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = in_r;
    si.hStdOutput = out_w;
    si.hStdError = err_w;
    PROCESS_INFORMATION pi = {};

    if (!CreateProcessA(nullptr, cmd_str.data(), nullptr, nullptr, TRUE,
                        CREATE_SUSPENDED | CREATE_NO_WINDOW, nullptr,
                        cwd.empty() ? nullptr : cwd.c_str(), &si, &pi)) {
        DWORD code = GetLastError();
        close_all();
        CloseHandle(job);
        if (code == ERROR_DIRECTORY) {
            return Result<ProcessHandle>::Err(
                fmt::format("cannot enter working directory '{}': {}", cwd, last_error_text(code)));
        }
        return Result<ProcessHandle>::Err(
            fmt::format("cannot execute '{}': {}", opts.program, last_error_text(code)));
    }

    AssignProcessToJobObject(job, pi.hProcess);
    ResumeThread(pi.hThread);

    close_handle(in_r);
    close_handle(out_w);
    close_handle(err_w);

    ProcessHandle handle;
    handle.handle_ = pi.hProcess;
    handle.thread_ = pi.hThread;
    handle.job_ = job;
    handle.stdin_ = in_w;
    handle.stdout_ = out_r;
    handle.stderr_ = err_r;
    return Result<ProcessHandle>::Ok(std::move(handle));
}

CapturedRun run_captured(ProcessHandle& proc, const std::optional<std::string>& input,
                         const CaptureLimits& limits) {
    CapturedRun run;
    auto start = Clock::now();
    std::atomic<bool> discard{false};
    std::atomic<int> readers_done{0};

    auto reader = [&](HANDLE pipe, std::string& dst, bool& truncated) {
        char buf[PIPE_READ_BUF_SIZE];
        DWORD n = 0;
        while (ReadFile(pipe, buf, sizeof(buf), &n, nullptr) && n > 0) {
            if (!discard.load()) append_capped(dst, truncated, buf, n, limits.max_output_bytes);
        }
        readers_done.fetch_add(1);
    };
    std::thread out_thread(reader, proc.stdout_pipe(), std::ref(run.stdout_data),
                           std::ref(run.stdout_truncated));
    std::thread err_thread(reader, proc.stderr_pipe(), std::ref(run.stderr_data),
                           std::ref(run.stderr_truncated));

    std::string pending = input.value_or("");
    std::thread in_thread;
    if (pending.empty()) {
        proc.close_stdin();
    } else {
        in_thread = std::thread([&proc, pending]() {
            DWORD written = 0;
            size_t offset = 0;
            while (offset < pending.size() &&
                   WriteFile(proc.stdin_pipe(), pending.data() + offset,
                             static_cast<DWORD>(pending.size() - offset), &written, nullptr)) {
                offset += written;
            }
            proc.close_stdin();
        });
    }

    int code = proc.wait(limits.timeout_ms);
    if (code == -1 && !proc.exited()) {
        run.timed_out = true;
        discard.store(true);
        proc.terminate();
    } else {
        auto drain_until = Clock::now() + std::chrono::milliseconds(ORPHAN_DRAIN_MS);
        while (readers_done.load() < 2 && Clock::now() < drain_until) {
            sleep_ms(10);
        }
        proc.kill_remaining();
    }

    out_thread.join();
    err_thread.join();
    if (in_thread.joinable()) in_thread.join();

    run.exit_code = proc.exit_code();
    run.duration_ms = elapsed_ms(start);
    return run;
}

#else

// ── Unix: process groups ────────────────────────────────────

static void close_fd(int& fd) {
    if (fd >= 0) close(fd);
    fd = -1;
}

void ProcessHandle::release() {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    if (pid_ > 0 && !exited_) {
        // Never leave a running tree behind a dropped handle.
        killpg(pid_, SIGKILL);
        waitpid(pid_, nullptr, 0);
    }
    pid_ = -1;
}

void ProcessHandle::record_exit(int status) {
    exited_ = true;
    if (WIFEXITED(status)) exit_code_ = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) exit_code_ = 128 + WTERMSIG(status);
    else exit_code_ = -1;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

bool ProcessHandle::running() {
    if (pid_ <= 0 || exited_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        record_exit(status);
        return false;
    }
    return ret == 0;  // 0 means still running
}

int ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (exited_) return exit_code_;
    if (timeout_ms < 0) {
        int status;
        pid_t ret;
        do {
            ret = waitpid(pid_, &status, 0);
        } while (ret < 0 && errno == EINTR);
        if (ret == pid_) record_exit(status);
        return exit_code_;
    }
    // Poll with timeout
    int elapsed = 0;
    while (elapsed < timeout_ms) {
        if (!running()) return exit_code_;
        sleep_ms(POLL_SLICE_MS);
        elapsed += POLL_SLICE_MS;
    }
    return running() ? -1 : exit_code_;
}

void ProcessHandle::terminate() {
    if (pid_ <= 0) return;
    killpg(pid_, SIGTERM);
    // Wait for graceful exit of the leader
    for (int waited = 0; waited < TERMINATE_GRACE_MS && running(); waited += 100) {
        sleep_ms(100);
    }
    // Stragglers that ignored SIGTERM, and any helpers the leader forked
    killpg(pid_, SIGKILL);
    if (!exited_) wait();
}

void ProcessHandle::kill_remaining() {
    if (pid_ > 0) killpg(pid_, SIGKILL);
}

void ProcessHandle::close_stdin() { close_fd(stdin_fd_); }
void ProcessHandle::close_stdout() { close_fd(stdout_fd_); }
void ProcessHandle::close_stderr() { close_fd(stderr_fd_); }

// ── spawn ────────────────────────────────────────────────────

namespace {

enum SpawnStage : int { STAGE_CHDIR = 1, STAGE_EXEC = 2 };

bool make_pipe(int fds[2]) {
#ifdef __linux__
    return pipe2(fds, O_CLOEXEC) == 0;
#else
    if (pipe(fds) != 0) return false;
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
#endif
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// Child side: report the failing stage and errno, then exit.
[[noreturn]] void report_and_exit(int fd, int stage) {
    int report[2] = {stage, errno};
    ssize_t ignored = write(fd, report, sizeof(report));
    (void)ignored;
    _exit(127);
}

std::once_flag sigpipe_once;

} // namespace

Result<ProcessHandle> spawn(const SpawnOptions& opts) {
    // A child that closes its stdin must show up as EPIPE, not kill us.
    std::call_once(sigpipe_once, []() { signal(SIGPIPE, SIG_IGN); });

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    auto close_all = [&]() {
        for (int* p : {in_pipe, out_pipe, err_pipe, status_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    if (!make_pipe(in_pipe) || !make_pipe(out_pipe) || !make_pipe(err_pipe) ||
        !make_pipe(status_pipe)) {
        int err = errno;
        close_all();
        return Result<ProcessHandle>::Err(fmt::format("cannot create pipes: {}", std::strerror(err)));
    }

    // Everything the child touches is prepared before fork.
    std::vector<const char*> argv;
    argv.push_back(opts.program.c_str());
    for (const auto& a : opts.args) argv.push_back(a.c_str());
    argv.push_back(nullptr);
    std::string cwd = opts.working_dir.string();

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_all();
        return Result<ProcessHandle>::Err(fmt::format("fork failed: {}", std::strerror(err)));
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);

        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            report_and_exit(status_pipe[1], STAGE_CHDIR);
        }

        execvp(opts.program.c_str(), const_cast<char* const*>(argv.data()));
        report_and_exit(status_pipe[1], STAGE_EXEC);
    }

    // Parent. Also set the group here so killpg works no matter who runs first.
    setpgid(pid, pid);
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(status_pipe[1]);

    // EOF on the status pipe means exec succeeded (close-on-exec).
    int report[2] = {0, 0};
    ssize_t n;
    do {
        n = read(status_pipe[0], report, sizeof(report));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(report))) {
        waitpid(pid, nullptr, 0);
        close_all();
        if (report[0] == STAGE_CHDIR) {
            return Result<ProcessHandle>::Err(
                fmt::format("cannot enter working directory '{}': {}", cwd, std::strerror(report[1])));
        }
        return Result<ProcessHandle>::Err(
            fmt::format("cannot execute '{}': {}", opts.program, std::strerror(report[1])));
    }

    set_nonblocking(in_pipe[1]);
    set_nonblocking(out_pipe[0]);
    set_nonblocking(err_pipe[0]);

    ProcessHandle handle;
    handle.pid_ = pid;
    handle.stdin_fd_ = in_pipe[1];
    handle.stdout_fd_ = out_pipe[0];
    handle.stderr_fd_ = err_pipe[0];
    in_pipe[1] = -1;
    out_pipe[0] = -1;
    err_pipe[0] = -1;
    return Result<ProcessHandle>::Ok(std::move(handle));
}

// ── run_captured ─────────────────────────────────────────────

CapturedRun run_captured(ProcessHandle& proc, const std::optional<std::string>& input,
                         const CaptureLimits& limits) {
    CapturedRun run;
    auto start = Clock::now();
    bool has_deadline = limits.timeout_ms >= 0;
    auto deadline = start + std::chrono::milliseconds(has_deadline ? limits.timeout_ms : 0);

    std::string pending = input.value_or("");
    size_t written = 0;
    if (pending.empty()) proc.close_stdin();

    bool draining = false;
    Clock::time_point drain_until;
    char buf[PIPE_READ_BUF_SIZE];

    auto drain_fd = [&](int fd, std::string& dst, bool& truncated, void (ProcessHandle::*close_fn)()) {
        while (true) {
            ssize_t r = read(fd, buf, sizeof(buf));
            if (r > 0) {
                append_capped(dst, truncated, buf, static_cast<size_t>(r), limits.max_output_bytes);
                continue;
            }
            if (r < 0 && errno == EINTR) continue;
            if (r < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
            (proc.*close_fn)();  // EOF or hard error
            return;
        }
    };

    while (true) {
        proc.running();
        bool out_open = proc.stdout_fd() >= 0;
        bool err_open = proc.stderr_fd() >= 0;
        if (proc.exited() && !out_open && !err_open) break;

        auto now = Clock::now();
        if (proc.exited()) {
            // Leader is gone; give helpers holding the pipes a short window.
            if (!draining) {
                draining = true;
                drain_until = now + std::chrono::milliseconds(ORPHAN_DRAIN_MS);
                if (has_deadline && deadline < drain_until) drain_until = deadline;
            }
            if (now >= drain_until) {
                proc.kill_remaining();
                break;
            }
        } else if (has_deadline && now >= deadline) {
            run.timed_out = true;
            proc.terminate();
            break;
        }

        int wait_ms = POLL_SLICE_MS;
        auto limit = draining ? drain_until : deadline;
        if (draining || has_deadline) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(limit - now).count();
            wait_ms = static_cast<int>(std::max<int64_t>(0, std::min<int64_t>(wait_ms, left)));
        }

        struct pollfd fds[3];
        int nfds = 0, out_idx = -1, err_idx = -1, in_idx = -1;
        if (out_open) { out_idx = nfds; fds[nfds++] = {proc.stdout_fd(), POLLIN, 0}; }
        if (err_open) { err_idx = nfds; fds[nfds++] = {proc.stderr_fd(), POLLIN, 0}; }
        if (proc.stdin_fd() >= 0 && written < pending.size()) {
            in_idx = nfds;
            fds[nfds++] = {proc.stdin_fd(), POLLOUT, 0};
        }

        if (nfds == 0) {
            sleep_ms(std::max(1, wait_ms));
            continue;
        }

        int rc = poll(fds, static_cast<nfds_t>(nfds), wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            proc.terminate();
            break;
        }
        if (rc == 0) continue;

        if (out_idx >= 0 && (fds[out_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
            drain_fd(proc.stdout_fd(), run.stdout_data, run.stdout_truncated, &ProcessHandle::close_stdout);
        }
        if (err_idx >= 0 && (fds[err_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
            drain_fd(proc.stderr_fd(), run.stderr_data, run.stderr_truncated, &ProcessHandle::close_stderr);
        }
        if (in_idx >= 0) {
            if (fds[in_idx].revents & POLLOUT) {
                size_t chunk = std::min<size_t>(pending.size() - written, 64 * 1024);
                ssize_t w = write(proc.stdin_fd(), pending.data() + written, chunk);
                if (w > 0) {
                    written += static_cast<size_t>(w);
                } else if (w < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    proc.close_stdin();  // EPIPE: child stopped reading
                }
            } else if (fds[in_idx].revents & (POLLERR | POLLHUP)) {
                proc.close_stdin();
            }
            if (written >= pending.size()) proc.close_stdin();
        }
    }

    proc.close_stdin();
    proc.close_stdout();
    proc.close_stderr();
    if (!proc.exited()) proc.wait();
    // Helpers that detached from the pipes are still in the group.
    proc.kill_remaining();

    run.exit_code = proc.exit_code();
    run.duration_ms = elapsed_ms(start);
    return run;
}

#endif

} // namespace platform
