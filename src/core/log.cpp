#include "log.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <fstream>
#include <chrono>
#include <ctime>
#include <mutex>

static std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

static std::string& log_path_storage() {
    static std::string path = (platform::temp_dir() / DEFAULT_LOG_FILE).string();
    return path;
}

std::string gate_log_path() {
    std::lock_guard<std::mutex> lock(log_mutex());
    return log_path_storage();
}

void set_log_path(const std::string& path) {
    if (path.empty()) return;
    std::lock_guard<std::mutex> lock(log_mutex());
    log_path_storage() = path;
}

void gate_log(const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    std::string line = fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {}\n",
                                   tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                                   static_cast<int>(ms.count()), msg);

    std::lock_guard<std::mutex> lock(log_mutex());
    std::ofstream out(log_path_storage(), std::ios::app);
    if (!out) return;
    out << line;
}

void gate_log_result(const std::string& label, const CommandRequest& req,
                     const ExecutionResult& r) {
    gate_log(fmt::format("{} [{}] CMD: {} (cwd={})", label, category_name(req.category),
                         req.command, r.working_directory.empty() ? "-" : r.working_directory));
    if (r.rejected()) {
        gate_log(fmt::format("{} rejected {}: {}", label, error_kind_name(r.error), r.message));
        return;
    }
    gate_log(fmt::format("{} outcome={} exit={} duration={}ms stdout({}) stderr({})",
                         label, error_kind_name(r.error), r.exit_code, r.duration_ms,
                         r.stdout_data.size(), r.stderr_data.size()));
    if (!r.success && !r.stderr_data.empty())
        gate_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, 500)));
}
