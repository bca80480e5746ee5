#include "gate_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <readline/readline.h>
#include <readline/history.h>

GateCLI::GateCLI(Config cfg) : BaseCLI(std::move(cfg)) {
    register_all_commands();
}

void GateCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [](BaseCLI& cli, const std::string& arg) {
        cli.quit_requested = true;
    }, "Exit cmdgate");

    add_command("exit", [](BaseCLI& cli, const std::string& arg) {
        cli.quit_requested = true;
    }, "Exit cmdgate");

    add_command("clear", [](BaseCLI& cli, const std::string& arg) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    register_tool_commands(*this);
    register_session_commands(*this);
}

void GateCLI::run_repl() {
    std::cout << theme::banner();

    std::cout << theme::section("Session");
    if (config.sources().empty()) {
        std::cout << theme::info("Using built-in policy");
    }
    for (const auto& src : config.sources()) {
        std::cout << theme::ok("Loaded " + src.string());
    }
    std::cout << theme::kv("Directory", session->cwd().string());
    if (gateway->policy().project_root) {
        std::cout << theme::kv("Root", gateway->policy().project_root->string());
    }
    std::cout << theme::kv("Log", gate_log_path());
    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    gate_log("repl: started " + now_iso() + " in " + session->cwd().string());

    std::string line;
    while (!quit_requested) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            std::cout << "\n";
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        execute_command(command, args);
    }

    gate_log("repl: exited");
}
