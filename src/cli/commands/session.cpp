#include <cli/base_cli.hpp>
#include <cli/theme.hpp>
#include <iostream>

static void do_cd(BaseCLI& cli, const std::string& arg) {
    auto result = cli.session->change_directory(arg);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        cli.last_exit_code = 1;
        return;
    }
    cli.last_exit_code = 0;
}

static void do_pwd(BaseCLI& cli, const std::string& arg) {
    std::cout << "    " << cli.session->cwd().string() << "\n";
}

static void do_policy(BaseCLI& cli, const std::string& arg) {
    print_policy(cli.gateway->policy());
    for (const auto& src : cli.config.sources()) {
        std::cout << theme::kv("loaded from", src.string());
    }
}

static void do_format(BaseCLI& cli, const std::string& arg) {
    if (arg == "text") {
        cli.format = OutputFormat::Text;
    } else if (arg == "yaml") {
        cli.format = OutputFormat::Yaml;
    } else {
        std::cout << theme::fail("Usage: format <text|yaml>");
        return;
    }
    std::cout << theme::ok("Output format: " + arg);
}

void register_session_commands(BaseCLI& cli) {
    cli.add_command("cd", do_cd, "Change the session directory");
    cli.add_command("pwd", do_pwd, "Show the session directory");
    cli.add_command("format", do_format, "Switch result output (text, yaml)");
    cli.add_command("policy", do_policy, "Show the active validation policy");
}
