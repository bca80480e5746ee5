#include <cli/base_cli.hpp>
#include <cli/theme.hpp>
#include <iostream>

static void do_npm(BaseCLI& cli, const std::string& arg) {
    cli.run_in_session(ToolCategory::Npm, arg);
}

static void do_python(BaseCLI& cli, const std::string& arg) {
    cli.run_in_session(ToolCategory::Python, arg);
}

static void do_terraform(BaseCLI& cli, const std::string& arg) {
    cli.run_in_session(ToolCategory::Terraform, arg);
}

static void do_git(BaseCLI& cli, const std::string& arg) {
    cli.run_in_session(ToolCategory::Git, arg);
}

static void do_run(BaseCLI& cli, const std::string& arg) {
    cli.run_in_session(ToolCategory::Generic, arg);
}

// check <category> <command...>
static void do_check(BaseCLI& cli, const std::string& arg) {
    auto space = arg.find(' ');
    std::string name = arg.substr(0, space);
    auto category = parse_category(name);
    if (!category || space == std::string::npos) {
        std::cout << theme::fail("Usage: check <npm|python|terraform|git|generic> <command>");
        return;
    }
    auto result = cli.session->check(*category, arg.substr(space + 1));
    cli.last_exit_code = result.success ? 0 : 1;
    print_result(result, cli.format);
}

void register_tool_commands(BaseCLI& cli) {
    cli.add_command("npm", do_npm, "Run an npm subcommand");
    cli.add_command("python", do_python, "Run pip, python or a Python tool");
    cli.add_command("terraform", do_terraform, "Run a terraform subcommand");
    cli.add_command("git", do_git, "Run a git subcommand");
    cli.add_command("run", do_run, "Run a generic allowlisted command");
    cli.add_command("check", do_check, "Validate a command without running it");
}
