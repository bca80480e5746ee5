#include <gtest/gtest.h>
#include <gateway/execution_engine.hpp>
#include <platform/process.hpp>
#include <core/config.hpp>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <thread>
#include <chrono>

namespace fs = std::filesystem;

#ifndef _WIN32

class ExecutionEngineTest : public ::testing::Test {
protected:
    fs::path test_dir;
    ValidationPolicy policy = default_policy();

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "cmdgate_engine_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    ExecutionResult run(std::vector<std::string> argv,
                        std::optional<std::string> input = std::nullopt,
                        int timeout_ms = 10000) {
        ExecutionEngine engine(std::make_shared<const ValidationPolicy>(policy));
        ExecutionPlan plan;
        plan.argv = std::move(argv);
        plan.working_dir = test_dir;
        plan.input = std::move(input);
        plan.timeout_ms = timeout_ms;
        return engine.run(plan);
    }

    static std::vector<std::string> sh(const std::string& script) {
        return {"/bin/sh", "-c", script};
    }
};

// True while a process exists and is not a zombie.
static bool process_alive(const std::string& pid) {
    std::ifstream stat("/proc/" + pid + "/stat");
    if (!stat) return false;
    std::string line;
    std::getline(stat, line);
    auto close = line.rfind(')');
    return close != std::string::npos && close + 2 < line.size() && line[close + 2] != 'Z';
}

TEST_F(ExecutionEngineTest, CapturesStdout) {
    auto r = run(sh("echo hello"));
    EXPECT_TRUE(r.success) << r.message;
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.stdout_data, "hello\n");
    EXPECT_EQ(r.stderr_data, "");
    EXPECT_EQ(r.error, ErrorKind::None);
}

TEST_F(ExecutionEngineTest, SeparatesStderr) {
    auto r = run(sh("echo out; echo err >&2"));
    EXPECT_EQ(r.stdout_data, "out\n");
    EXPECT_EQ(r.stderr_data, "err\n");
}

TEST_F(ExecutionEngineTest, RunsInWorkingDirectory) {
    auto r = run({"pwd"});
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(fs::weakly_canonical(r.stdout_data.substr(0, r.stdout_data.size() - 1)),
              fs::weakly_canonical(test_dir));
}

TEST_F(ExecutionEngineTest, ArgumentsAreNotShellExpanded) {
    auto r = run({"echo", "$HOME", "*", "a;b"});
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.stdout_data, "$HOME * a;b\n");
}

TEST_F(ExecutionEngineTest, FeedsStdin) {
    auto r = run({"cat"}, std::string("line one\nline two\n"));
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(r.stdout_data, "line one\nline two\n");
}

TEST_F(ExecutionEngineTest, LargeStdinDoesNotDeadlock) {
    std::string big(512 * 1024, 'x');
    auto r = run({"cat"}, big);
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(r.stdout_data.size(), big.size());
}

TEST_F(ExecutionEngineTest, NoInputClosesStdin) {
    auto r = run({"cat"}, std::nullopt, 5000);
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.stdout_data, "");
}

TEST_F(ExecutionEngineTest, NonzeroExitIsToolFailure) {
    auto r = run(sh("echo partial; exit 3"));
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorKind::ToolFailure);
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_EQ(r.stdout_data, "partial\n");
}

TEST_F(ExecutionEngineTest, DeadlineTerminatesProcess) {
    auto start = std::chrono::steady_clock::now();
    auto r = run(sh("echo started; sleep 30"), std::nullopt, 300);
    auto took = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorKind::TimedOut);
    EXPECT_EQ(r.stdout_data, "started\n");
    EXPECT_LT(took, std::chrono::seconds(5));
}

TEST_F(ExecutionEngineTest, IgnoredSigtermStillKilled) {
    auto start = std::chrono::steady_clock::now();
    auto r = run(sh("trap '' TERM; sleep 30"), std::nullopt, 200);
    auto took = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(r.error, ErrorKind::TimedOut);
    EXPECT_LT(took, std::chrono::seconds(8));
}

TEST_F(ExecutionEngineTest, BackgroundChildDoesNotOutliveRequest) {
    auto start = std::chrono::steady_clock::now();
    auto r = run(sh("sleep 30 & echo $!"));
    auto took = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(r.success) << r.message;
    EXPECT_LT(took, std::chrono::seconds(5));

    std::string pid = r.stdout_data.substr(0, r.stdout_data.find('\n'));
    ASSERT_FALSE(pid.empty());
    bool alive = process_alive(pid);
    for (int i = 0; i < 20 && alive; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        alive = process_alive(pid);
    }
    EXPECT_FALSE(alive);
}

TEST_F(ExecutionEngineTest, DetachedHelperKilledAfterLeaderExits) {
    auto marker = test_dir / "helper_ran";
    auto r = run(sh("(sleep 1; touch " + marker.string() + ") >/dev/null 2>&1 </dev/null &"));
    ASSERT_TRUE(r.success) << r.message;

    std::this_thread::sleep_for(std::chrono::milliseconds(2000));
    EXPECT_FALSE(fs::exists(marker));
}

TEST_F(ExecutionEngineTest, DeadlineKillsForkedHelpers) {
    auto marker = test_dir / "helper_ran";
    auto r = run(sh("(sleep 1; touch " + marker.string() + "; echo late) & echo early; sleep 30"),
                 std::nullopt, 300);
    EXPECT_EQ(r.error, ErrorKind::TimedOut);
    EXPECT_EQ(r.stdout_data, "early\n");

    std::this_thread::sleep_for(std::chrono::milliseconds(2000));
    EXPECT_FALSE(fs::exists(marker));
}

TEST_F(ExecutionEngineTest, MissingProgramIsSpawnError) {
    auto r = run({"cmdgate-no-such-program-xyz"});
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorKind::SpawnError);
    EXPECT_NE(r.message.find("cannot execute 'cmdgate-no-such-program-xyz'"), std::string::npos);
}

TEST_F(ExecutionEngineTest, EmptyArgvIsSpawnError) {
    auto r = run({});
    EXPECT_EQ(r.error, ErrorKind::SpawnError);
}

TEST_F(ExecutionEngineTest, OutputCapped) {
    policy.max_output_bytes = 100;
    auto r = run(sh("i=0; while [ $i -lt 100 ]; do echo 0123456789; i=$((i+1)); done"));
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.stdout_data.size(), 100u);
    EXPECT_NE(r.message.find("output truncated (stdout)"), std::string::npos);
}

// ── platform::spawn directly ────────────────────────────────

TEST(Spawn, BadWorkingDirectoryReported) {
    platform::SpawnOptions opts;
    opts.program = "/bin/sh";
    opts.args = {"-c", "true"};
    opts.working_dir = "/nonexistent/cmdgate/dir";

    auto r = platform::spawn(opts);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("cannot enter working directory '/nonexistent/cmdgate/dir'"),
              std::string::npos);
}

TEST(Spawn, ExitCodeAfterWait) {
    platform::SpawnOptions opts;
    opts.program = "/bin/sh";
    opts.args = {"-c", "exit 7"};

    auto r = platform::spawn(opts);
    ASSERT_TRUE(r.is_ok()) << r.error;
    auto proc = std::move(r.value);
    proc.close_stdin();
    EXPECT_EQ(proc.wait(), 7);
    EXPECT_TRUE(proc.exited());
    EXPECT_FALSE(proc.running());
}

TEST(Spawn, TerminateReportsSignal) {
    platform::SpawnOptions opts;
    opts.program = "sleep";
    opts.args = {"30"};

    auto r = platform::spawn(opts);
    ASSERT_TRUE(r.is_ok()) << r.error;
    auto proc = std::move(r.value);
    EXPECT_GT(proc.native_handle(), 0);
    EXPECT_TRUE(proc.running());
    proc.terminate();
    EXPECT_TRUE(proc.exited());
    EXPECT_EQ(proc.exit_code(), 128 + 15);
}

#endif
