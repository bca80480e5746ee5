#include <gtest/gtest.h>
#include <gateway/command_gateway.hpp>
#include <gateway/result_reporter.hpp>
#include <core/config.hpp>
#include <platform/platform.hpp>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <thread>
#include <chrono>
#include <atomic>

namespace fs = std::filesystem;

#ifndef _WIN32

class GatewayTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::unique_ptr<CommandGateway> gateway;

    void SetUp() override {
        test_dir = fs::weakly_canonical(fs::temp_directory_path()) / "cmdgate_gateway_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir / "app" / "src");
        fs::create_directories(test_dir / "other");
        make_gateway();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    void make_gateway(std::optional<fs::path> root = std::nullopt) {
        ValidationPolicy policy = default_policy();
        policy.tools[ToolCategory::Generic].allowed.insert({"sh", "sleep", "touch"});
        policy.project_root = std::move(root);
        gateway = std::make_unique<CommandGateway>(std::make_shared<const ValidationPolicy>(policy));
    }

    static std::string trimmed(const std::string& s) {
        return s.substr(0, s.find_last_not_of('\n') + 1);
    }
};

TEST_F(GatewayTest, RunsAllowedCommand) {
    auto r = gateway->run_command("echo hello world", test_dir.string());
    EXPECT_TRUE(r.success) << r.message;
    EXPECT_EQ(r.stdout_data, "hello world\n");
    EXPECT_EQ(r.command, (std::vector<std::string>{"echo", "hello", "world"}));
    EXPECT_EQ(r.working_directory, test_dir.string());
}

TEST_F(GatewayTest, QuotedMetacharactersReachProgramLiterally) {
    auto r = gateway->run_command("echo \"a|b; c & (d)\"", test_dir.string());
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(r.stdout_data, "a|b; c & (d)\n");
}

TEST_F(GatewayTest, UnknownCommandListsAllowed) {
    auto r = gateway->run_command("rm -rf /", test_dir.string());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorKind::UnknownCommand);
    EXPECT_EQ(r.message, "Command not allowed: rm");
    EXPECT_EQ(r.exit_code, -1);
    EXPECT_FALSE(r.allowed_commands.empty());
    EXPECT_TRUE(r.command.empty());
}

TEST_F(GatewayTest, InjectionNeverExecutes) {
    auto r = gateway->run_command("touch created.txt; echo x", test_dir.string());
    EXPECT_EQ(r.error, ErrorKind::InjectionAttempt);
    EXPECT_EQ(r.exit_code, -1);
    EXPECT_FALSE(fs::exists(test_dir / "created.txt"));
}

TEST_F(GatewayTest, SubshellNeverExecutes) {
    auto r = gateway->run_command("touch $(echo created.txt)", test_dir.string());
    EXPECT_EQ(r.error, ErrorKind::SubshellAttempt);
    EXPECT_FALSE(fs::exists(test_dir / "created.txt"));
}

TEST_F(GatewayTest, RestrictedWorkingDirectory) {
    auto r = gateway->run_command("ls", "/etc");
    EXPECT_EQ(r.error, ErrorKind::PathRestricted);
    EXPECT_EQ(r.message, "Working directory blocked: Access to restricted path: /etc");
    EXPECT_EQ(r.working_directory, "/etc");

    auto up = gateway->run_command("ls", test_dir.string() + "/../../../../../../etc");
    EXPECT_EQ(up.error, ErrorKind::PathRestricted);
}

TEST_F(GatewayTest, ProjectRootEnforced) {
    make_gateway(test_dir / "app");
    EXPECT_TRUE(gateway->run_command("ls", (test_dir / "app" / "src").string()).success);

    auto r = gateway->run_command("ls", (test_dir / "app" / ".." / "other").string());
    EXPECT_EQ(r.error, ErrorKind::PathTraversal);
}

TEST_F(GatewayTest, MissingDirectoryIsSpawnError) {
    auto missing = test_dir / "missing";
    auto r = gateway->run_command("ls", missing.string());
    EXPECT_EQ(r.error, ErrorKind::SpawnError);
    EXPECT_EQ(r.message, "Failed to start process: Working directory does not exist: " + missing.string());
}

TEST_F(GatewayTest, MissingProgramIsSpawnError) {
    // Allowlisted but not installed anywhere on PATH
    ValidationPolicy policy = default_policy();
    policy.tools[ToolCategory::Generic].allowed.insert("ghost");
    CommandGateway g(std::make_shared<const ValidationPolicy>(policy));

    auto r = g.run_command("ghost --version", test_dir.string());
    EXPECT_EQ(r.error, ErrorKind::SpawnError);
    EXPECT_EQ(r.exit_code, -1);
}

TEST_F(GatewayTest, ToolFailureCarriesExitCode) {
    auto r = gateway->run_command("sh -c \"echo bad >&2; exit 4\"", test_dir.string());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorKind::ToolFailure);
    EXPECT_EQ(r.exit_code, 4);
    EXPECT_EQ(r.stderr_data, "bad\n");
}

TEST_F(GatewayTest, StdinForwarded) {
    auto r = gateway->run_command("cat", test_dir.string(), std::string("piped text"));
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(r.stdout_data, "piped text");
}

TEST_F(GatewayTest, TimeoutOverrideApplied) {
    CommandRequest req;
    req.command = "sleep 30";
    req.working_directory = test_dir;
    req.timeout_secs = 1;

    auto start = std::chrono::steady_clock::now();
    auto r = gateway->execute(req);
    auto took = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(r.error, ErrorKind::TimedOut);
    EXPECT_EQ(r.message, "sleep timed out after 1.0s");
    EXPECT_LT(took, std::chrono::seconds(6));
}

TEST_F(GatewayTest, ValidateDoesNotExecute) {
    CommandRequest req;
    req.command = "touch created.txt";
    req.working_directory = test_dir;

    auto r = gateway->validate(req);
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.message, "Approved, timeout 60s");
    EXPECT_FALSE(fs::exists(test_dir / "created.txt"));
}

TEST_F(GatewayTest, ValidateAppliesMultiplierAndAlias) {
    CommandRequest req;
    req.category = ToolCategory::Python;
    req.command = "pip install requests";
    req.working_directory = test_dir;

    auto r = gateway->validate(req);
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(r.command, (std::vector<std::string>{"python3", "-m", "pip", "install", "requests"}));
    EXPECT_EQ(r.message, "Approved, timeout 120s");

    req.category = ToolCategory::Terraform;
    req.command = "plan";
    req.timeout_secs = 1000;
    auto tf = gateway->validate(req);
    ASSERT_TRUE(tf.success);
    EXPECT_EQ(tf.command, (std::vector<std::string>{"terraform", "plan"}));
    EXPECT_EQ(tf.message, "Approved, timeout 3600s");
}

TEST_F(GatewayTest, ProgramNamedInCommandIsApproved) {
    CommandRequest npm;
    npm.category = ToolCategory::Npm;
    npm.command = "npm install express";
    npm.working_directory = test_dir;

    auto r = gateway->validate(npm);
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(r.command, (std::vector<std::string>{"npm", "install", "express"}));
    EXPECT_EQ(r.message, "Approved, timeout 180s");

    CommandRequest tf;
    tf.category = ToolCategory::Terraform;
    tf.command = "terraform version";
    tf.working_directory = test_dir;

    // Same verdict every time
    for (int i = 0; i < 3; i++) {
        auto v = gateway->validate(tf);
        ASSERT_TRUE(v.success) << v.message;
        EXPECT_EQ(v.command, (std::vector<std::string>{"terraform", "version"}));
        EXPECT_EQ(v.message, "Approved, timeout 600s");
    }
}

TEST_F(GatewayTest, ProgramNamedInCommandRunsOnce) {
    // npm stand-in that prints its arguments
    ValidationPolicy policy = default_policy();
    policy.tools[ToolCategory::Npm].program = "echo";
    policy.tools[ToolCategory::Npm].allowed = {"install"};
    CommandGateway g(std::make_shared<const ValidationPolicy>(policy));

    auto r = g.run_npm("echo install express", test_dir.string());
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(outcome_name(r), "Completed");
    EXPECT_EQ(r.stdout_data, "install express\n");

    auto bare = g.run_npm("install express", test_dir.string());
    ASSERT_TRUE(bare.success) << bare.message;
    EXPECT_EQ(bare.stdout_data, "install express\n");
}

TEST_F(GatewayTest, HugeTimeoutKeepsDeadline) {
    ValidationPolicy policy = default_policy();
    policy.timeout_ceiling_secs = 100000000;
    CommandGateway g(std::make_shared<const ValidationPolicy>(policy));

    CommandRequest req;
    req.category = ToolCategory::Terraform;
    req.command = "plan";
    req.working_directory = test_dir;
    req.timeout_secs = 1000000;

    auto r = g.validate(req);
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(r.message, "Approved, timeout 2147483s");
}

TEST_F(GatewayTest, CategoryEntryPointsRejectForeignCommands) {
    EXPECT_EQ(gateway->run_npm("exec evil", test_dir.string()).error, ErrorKind::UnknownCommand);
    EXPECT_EQ(gateway->run_git("filter-branch", test_dir.string()).error, ErrorKind::UnknownCommand);
    EXPECT_EQ(gateway->run_terraform("login", test_dir.string()).error, ErrorKind::UnknownCommand);
    EXPECT_EQ(gateway->run_python("pip download x", test_dir.string()).error, ErrorKind::UnknownCommand);
}

TEST_F(GatewayTest, ConcurrentRequestsAreIndependent) {
    const int n = 8;
    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    for (int i = 0; i < n; i++) {
        fs::create_directories(test_dir / ("w" + std::to_string(i)));
        threads.emplace_back([&, i]() {
            auto dir = test_dir / ("w" + std::to_string(i));
            auto r = gateway->run_command("sh -c \"sleep 0.2; pwd; echo " + std::to_string(i) + "\"",
                                          dir.string());
            std::string expected = dir.string() + "\n" + std::to_string(i) + "\n";
            if (r.success && r.stdout_data == expected) ok++;
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(ok.load(), n);
}

// ── Session ─────────────────────────────────────────────────

TEST_F(GatewayTest, SessionCdDoesNotMoveProcess) {
    auto before = platform::current_dir();
    Session session(*gateway, test_dir);

    auto r = session.change_directory("app/src");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(session.cwd(), test_dir / "app" / "src");
    EXPECT_EQ(platform::current_dir(), before);

    auto up = session.change_directory("..");
    ASSERT_TRUE(up.is_ok());
    EXPECT_EQ(session.cwd(), test_dir / "app");
}

TEST_F(GatewayTest, SessionRunsInItsDirectory) {
    Session session(*gateway, test_dir);
    ASSERT_TRUE(session.change_directory("other").is_ok());

    auto r = session.run(ToolCategory::Generic, "pwd");
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(trimmed(r.stdout_data), (test_dir / "other").string());
}

TEST_F(GatewayTest, SessionCdRejections) {
    Session session(*gateway, test_dir);

    auto restricted = session.change_directory("/etc");
    ASSERT_TRUE(restricted.is_err());
    EXPECT_EQ(restricted.error.rfind("PathRestricted: ", 0), 0u);

    auto missing = session.change_directory("nowhere");
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.error.rfind("No such directory: ", 0), 0u);

    EXPECT_EQ(session.cwd(), test_dir);
}

TEST_F(GatewayTest, SessionCdConfinedToRoot) {
    make_gateway(test_dir / "app");
    Session session(*gateway, test_dir / "app");

    auto r = session.change_directory("../other");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.rfind("PathTraversal: ", 0), 0u);
}

TEST_F(GatewayTest, SessionsAreIsolated) {
    Session a(*gateway, test_dir);
    Session b(*gateway, test_dir);
    ASSERT_TRUE(a.change_directory("app").is_ok());
    EXPECT_EQ(b.cwd(), test_dir);
}

TEST_F(GatewayTest, SessionCheck) {
    Session session(*gateway, test_dir);
    auto r = session.check(ToolCategory::Git, "status");
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(r.working_directory, test_dir.string());
    EXPECT_EQ(r.command, (std::vector<std::string>{"git", "status"}));
}

#endif
