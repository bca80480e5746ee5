#include <iostream>
#include <vector>
#include <string>
#include <core/config.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <core/constants.hpp>
#include <gateway/command_gateway.hpp>
#include "cli/gate_cli.hpp"
#include "cli/result_view.hpp"
#include "cli/theme.hpp"

static void print_usage() {
    auto row = [](const std::string& cmd, const std::string& arg, const std::string& help) {
        std::cout << theme::color::TEAL << "    cmdgate " << cmd
                  << theme::color::RESET << theme::color::SAND << arg
                  << theme::color::RESET << theme::color::DIM
                  << help << theme::color::RESET << "\n";
    };

    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    row("", "",                         "                        Start an interactive session");
    row("run ", "[options] -- <cmd>",   "      Validate and run one command");
    row("check ", "[options] -- <cmd>", "    Validate without running");
    row("policy", "",                   "                  Show the effective policy");
    row("init-config ", "[path]",       "        Write a default config file");

    std::cout << theme::section("Options");
    std::cout << theme::color::DIM
              << "    --category C          npm, python, terraform, git, generic (default)\n"
              << "    --cwd DIR             Working directory for the command\n"
              << "    --timeout S           Base timeout override in seconds\n"
              << "    --input TEXT          Text written to the command's stdin\n"
              << "    --format F            text (default) or yaml\n"
              << "    --config FILE         Use this config file only\n"
              << "    --root DIR            Confine working directories to DIR\n"
              << "\n"
              << "    cmdgate --version     Show version\n"
              << "    cmdgate --help        Show this help"
              << theme::color::RESET << "\n\n";
}

struct CliOptions {
    ToolCategory category = ToolCategory::Generic;
    std::optional<std::string> cwd;
    std::optional<int> timeout_secs;
    std::optional<std::string> input;
    OutputFormat format = OutputFormat::Text;
    std::optional<std::string> config_file;
    std::optional<std::string> root;
    std::vector<std::string> command;
};

// Parse flags after the subcommand. Everything after "--" (or the first
// non-flag word) is the command line.
static Result<CliOptions> parse_options(int argc, char** argv, int start) {
    CliOptions opts;
    int i = start;

    auto value = [&](const std::string& flag) -> Result<std::string> {
        if (i + 1 >= argc) {
            return Result<std::string>::Err("Missing value for " + flag);
        }
        return Result<std::string>::Ok(argv[++i]);
    };

    for (; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--") {
            i++;
            break;
        }
        if (arg.rfind("--", 0) != 0) {
            break;
        }

        auto v = value(arg);
        if (v.is_err()) {
            return Result<CliOptions>::Err(v.error);
        }

        if (arg == "--category") {
            auto c = parse_category(v.value);
            if (!c) {
                return Result<CliOptions>::Err("Unknown category: " + v.value);
            }
            opts.category = *c;
        } else if (arg == "--cwd") {
            opts.cwd = v.value;
        } else if (arg == "--timeout") {
            int secs = safe_stoi(v.value, -1);
            if (secs <= 0) {
                return Result<CliOptions>::Err("Invalid timeout: " + v.value);
            }
            opts.timeout_secs = secs;
        } else if (arg == "--input") {
            opts.input = v.value;
        } else if (arg == "--format") {
            if (v.value == "text") {
                opts.format = OutputFormat::Text;
            } else if (v.value == "yaml") {
                opts.format = OutputFormat::Yaml;
            } else {
                return Result<CliOptions>::Err("Unknown format: " + v.value);
            }
        } else if (arg == "--config") {
            opts.config_file = v.value;
        } else if (arg == "--root") {
            opts.root = v.value;
        } else {
            return Result<CliOptions>::Err("Unknown option: " + arg);
        }
    }

    for (; i < argc; i++) {
        opts.command.push_back(argv[i]);
    }
    return Result<CliOptions>::Ok(std::move(opts));
}

static Result<Config> load_config(const CliOptions& opts) {
    auto loaded = opts.config_file ? Config::load_file(*opts.config_file) : Config::load();
    if (loaded.is_err()) {
        return loaded;
    }
    Config config = loaded.value;
    if (opts.root) {
        config = config.with_project_root(*opts.root);
    }
    if (!config.policy()->log_file.empty()) {
        set_log_path(config.policy()->log_file);
    }
    return Result<Config>::Ok(std::move(config));
}

// run / check
static int run_one_shot(int argc, char** argv, bool execute) {
    auto parsed = parse_options(argc, argv, 2);
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        std::cout << theme::step("Run 'cmdgate --help' for usage.");
        return EXIT_REJECTED;
    }
    const auto& opts = parsed.value;
    if (opts.command.empty()) {
        std::cout << theme::fail("Missing command.");
        std::cout << theme::step("Usage: cmdgate run [options] -- <command...>");
        return EXIT_REJECTED;
    }

    auto config = load_config(opts);
    if (config.is_err()) {
        std::cout << theme::fail(config.error);
        return EXIT_REJECTED;
    }

    CommandGateway gateway(config.value.policy());

    // Words are joined with single spaces into the command line the gateway
    // checks. Pass the line as one quoted word to keep inner quoting.
    CommandRequest req;
    req.command = join_args(opts.command);
    req.category = opts.category;
    req.input = opts.input;
    req.timeout_secs = opts.timeout_secs;
    if (opts.cwd) {
        req.working_directory = fs::path(*opts.cwd);
    }

    ExecutionResult result = execute ? gateway.execute(req) : gateway.validate(req);
    print_result(result, opts.format);
    if (!execute) {
        return result.success ? 0 : EXIT_REJECTED;
    }
    return exit_status_for(result);
}

static int run_policy(int argc, char** argv) {
    auto parsed = parse_options(argc, argv, 2);
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        return EXIT_REJECTED;
    }
    auto config = load_config(parsed.value);
    if (config.is_err()) {
        std::cout << theme::fail(config.error);
        return EXIT_REJECTED;
    }
    print_policy(*config.value.policy());
    for (const auto& src : config.value.sources()) {
        std::cout << theme::kv("loaded from", src.string());
    }
    return 0;
}

static int run_init_config(int argc, char** argv) {
    fs::path target = argc >= 3 ? fs::path(argv[2]) : get_project_config_path();
    auto result = create_default_config(target);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return EXIT_REJECTED;
    }
    std::cout << theme::ok("Wrote " + target.string());
    return 0;
}

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            auto config = Config::load();
            if (config.is_err()) {
                std::cout << theme::fail(config.error);
                return EXIT_REJECTED;
            }
            if (!config.value.policy()->log_file.empty()) {
                set_log_path(config.value.policy()->log_file);
            }
            GateCLI cli(config.value);
            cli.run_repl();
            return 0;
        }

        std::string cmd = argv[1];

        if (cmd == "--version") {
            std::cout << theme::color::TEAL << theme::color::BOLD << "cmdgate"
                      << theme::color::RESET << theme::color::DIM
                      << " version 0.2.0" << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        } else if (cmd == "run") {
            return run_one_shot(argc, argv, true);
        } else if (cmd == "check") {
            return run_one_shot(argc, argv, false);
        } else if (cmd == "policy") {
            return run_policy(argc, argv);
        } else if (cmd == "init-config") {
            return run_init_config(argc, argv);
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
